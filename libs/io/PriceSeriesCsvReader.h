// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_CSV_READER_H
#define __PRICE_SERIES_CSV_READER_H 1

#include <cstddef>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "PriceSeries.h"
#include "TimeSeriesException.h"

namespace alphaflow
{
  using boost::posix_time::ptime;

  class CsvReaderException : public AlphaFlowException
  {
  public:
    explicit CsvReaderException(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

  /**
   * @class PriceSeriesCsvReader
   * @brief Reads an OHLCV file with the header timestamp,open,high,low,close,volume.
   *
   * Header names are matched case insensitively but must appear in that order.
   * Timestamps may be "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or
   * "YYYY-MM-DDTHH:MM:SS". Rows must be in strictly increasing time order.
   *
   * Bars whose high or low is inconsistent with the other prices are kept;
   * each inconsistency is reported as a warning on standard output.
   */
  class PriceSeriesCsvReader
  {
  public:
    /**
     * @throws CsvReaderException if the file cannot be opened.
     */
    explicit PriceSeriesCsvReader (const std::string& fileName);

    /**
     * @throws CsvReaderException on a bad header, malformed row or out of order timestamp.
     */
    void readFile();

    const std::string& getFileName() const
    {
      return mFileName;
    }

    const PriceSeries& getPriceSeries() const
    {
      return mSeries;
    }

    /// Number of OHLC consistency warnings reported by the last readFile()
    std::size_t getNumWarnings() const
    {
      return mNumWarnings;
    }

    /**
     * @throws CsvReaderException if text is not one of the accepted timestamp formats.
     */
    static ptime parseTimestamp (const std::string& text);

  private:
    bool checkForErrors (const ptime& dateTime,
			 double openPrice, double highPrice,
			 double lowPrice, double closePrice);

    double parsePrice (const std::string& text, const char *columnName, unsigned lineNumber) const;

  private:
    std::string mFileName;
    PriceSeries mSeries;
    std::size_t mNumWarnings;
  };

  /**
   * @brief Read benchmark bar returns, one number per line.
   *
   * Blank lines are skipped and a non-numeric first line is treated as a header.
   *
   * @throws CsvReaderException if the file cannot be opened or a later line is not numeric.
   */
  std::vector<double> readReturnsFile (const std::string& fileName);
} // namespace alphaflow

#endif
