// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_H
#define __PRICE_SERIES_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeSeriesException.h"

namespace alphaflow
{
  using boost::posix_time::ptime;

  /**
   * @class PriceBar
   * @brief One timestamped OHLCV observation.
   */
  class PriceBar
  {
  public:
    PriceBar (const ptime& dateTime,
	      double openPrice,
	      double highPrice,
	      double lowPrice,
	      double closePrice,
	      double volume);

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    double getOpenValue() const
    {
      return mOpen;
    }

    double getHighValue() const
    {
      return mHigh;
    }

    double getLowValue() const
    {
      return mLow;
    }

    double getCloseValue() const
    {
      return mClose;
    }

    double getVolumeValue() const
    {
      return mVolume;
    }

  private:
    ptime mDateTime;
    double mOpen;
    double mHigh;
    double mLow;
    double mClose;
    double mVolume;
  };

  /**
   * @class PriceSeries
   * @brief Time ordered sequence of bars plus named numeric columns aligned to them.
   *
   * The OHLCV fields of every bar are exposed as the columns "open", "high",
   * "low", "close" and "volume". Indicator output is appended as additional
   * columns that carry exactly one value per bar.
   *
   * Invariants:
   * - bar timestamps are strictly increasing;
   * - every column has getNumBars() values;
   * - once an indicator column exists no further bars may be added.
   *
   * A PriceSeries is a plain value; copies are independent so concurrent
   * evaluation runs can each own one.
   */
  class PriceSeries
  {
  public:
    typedef std::vector<PriceBar>::const_iterator ConstBarIterator;

    static const char *const OpenColumn;
    static const char *const HighColumn;
    static const char *const LowColumn;
    static const char *const CloseColumn;
    static const char *const VolumeColumn;

    PriceSeries();

    /**
     * @brief Append a bar at the end of the series.
     * @throws PriceSeriesException if the timestamp is not later than the last bar
     *         or indicator columns have already been added.
     */
    void addBar (const PriceBar& bar);

    /**
     * @brief Add (or replace) an indicator column.
     * @throws PriceSeriesException if the column length differs from the number of bars
     *         or the name is one of the OHLCV column names.
     */
    void addColumn (const std::string& name, std::vector<double> values);

    bool hasColumn (const std::string& name) const;

    /**
     * @return pointer to the column values, or nullptr when no such column exists.
     */
    const std::vector<double>* findColumn (const std::string& name) const;

    /**
     * @throws PriceSeriesException if the column does not exist.
     */
    const std::vector<double>& getColumn (const std::string& name) const;

    std::vector<std::string> getColumnNames() const;

    static bool isPriceColumn (const std::string& name);

    std::size_t getNumBars() const
    {
      return mBars.size();
    }

    bool empty() const
    {
      return mBars.empty();
    }

    const PriceBar& getBar (std::size_t barIndex) const;

    ConstBarIterator beginBars() const
    {
      return mBars.begin();
    }

    ConstBarIterator endBars() const
    {
      return mBars.end();
    }

  private:
    std::vector<PriceBar> mBars;
    std::map<std::string, std::vector<double>> mColumns;
    std::size_t mNumIndicatorColumns;
  };
} // namespace alphaflow

#endif
