// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PriceSeries.h"
#include <utility>

namespace alphaflow
{
  const char *const PriceSeries::OpenColumn = "open";
  const char *const PriceSeries::HighColumn = "high";
  const char *const PriceSeries::LowColumn = "low";
  const char *const PriceSeries::CloseColumn = "close";
  const char *const PriceSeries::VolumeColumn = "volume";

  PriceBar::PriceBar (const ptime& dateTime,
		      double openPrice,
		      double highPrice,
		      double lowPrice,
		      double closePrice,
		      double volume)
    : mDateTime(dateTime),
      mOpen(openPrice),
      mHigh(highPrice),
      mLow(lowPrice),
      mClose(closePrice),
      mVolume(volume)
  {
    if (dateTime.is_special())
      throw PriceSeriesException("PriceBar: bar timestamp must be a valid date and time");
  }

  PriceSeries::PriceSeries()
    : mBars(),
      mColumns(),
      mNumIndicatorColumns(0)
  {
    mColumns[OpenColumn];
    mColumns[HighColumn];
    mColumns[LowColumn];
    mColumns[CloseColumn];
    mColumns[VolumeColumn];
  }

  void PriceSeries::addBar (const PriceBar& bar)
  {
    if (mNumIndicatorColumns > 0)
      throw PriceSeriesException("PriceSeries::addBar - cannot add bar at " +
				 boost::posix_time::to_simple_string(bar.getDateTime()) +
				 " after indicator columns have been added");

    if (!mBars.empty() && !(mBars.back().getDateTime() < bar.getDateTime()))
      throw PriceSeriesException("PriceSeries::addBar - timestamp " +
				 boost::posix_time::to_simple_string(bar.getDateTime()) +
				 " is not later than previous bar at " +
				 boost::posix_time::to_simple_string(mBars.back().getDateTime()));

    mBars.push_back(bar);
    mColumns[OpenColumn].push_back(bar.getOpenValue());
    mColumns[HighColumn].push_back(bar.getHighValue());
    mColumns[LowColumn].push_back(bar.getLowValue());
    mColumns[CloseColumn].push_back(bar.getCloseValue());
    mColumns[VolumeColumn].push_back(bar.getVolumeValue());
  }

  void PriceSeries::addColumn (const std::string& name, std::vector<double> values)
  {
    if (name.empty())
      throw PriceSeriesException("PriceSeries::addColumn - column name must not be empty");

    if (isPriceColumn(name))
      throw PriceSeriesException("PriceSeries::addColumn - cannot replace price column '" + name + "'");

    if (values.size() != mBars.size())
      throw PriceSeriesException("PriceSeries::addColumn - column '" + name + "' has " +
				 std::to_string(values.size()) + " values but series has " +
				 std::to_string(mBars.size()) + " bars");

    auto it = mColumns.find(name);
    if (it == mColumns.end())
      {
	mColumns.emplace(name, std::move(values));
	mNumIndicatorColumns++;
      }
    else
      it->second = std::move(values);
  }

  bool PriceSeries::hasColumn (const std::string& name) const
  {
    return mColumns.find(name) != mColumns.end();
  }

  const std::vector<double>* PriceSeries::findColumn (const std::string& name) const
  {
    auto it = mColumns.find(name);
    if (it == mColumns.end())
      return nullptr;

    return &(it->second);
  }

  const std::vector<double>& PriceSeries::getColumn (const std::string& name) const
  {
    const std::vector<double>* column = findColumn(name);
    if (column == nullptr)
      throw PriceSeriesException("PriceSeries::getColumn - no column named '" + name + "'");

    return *column;
  }

  std::vector<std::string> PriceSeries::getColumnNames() const
  {
    std::vector<std::string> names;
    names.reserve(mColumns.size());

    for (const auto& column : mColumns)
      names.push_back(column.first);

    return names;
  }

  bool PriceSeries::isPriceColumn (const std::string& name)
  {
    return (name == OpenColumn) || (name == HighColumn) || (name == LowColumn) ||
      (name == CloseColumn) || (name == VolumeColumn);
  }

  const PriceBar& PriceSeries::getBar (std::size_t barIndex) const
  {
    if (barIndex >= mBars.size())
      throw PriceSeriesException("PriceSeries::getBar - bar index " + std::to_string(barIndex) +
				 " out of range for series with " + std::to_string(mBars.size()) + " bars");

    return mBars[barIndex];
  }
} // namespace alphaflow
