// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TimeSeriesIndicators.h"
#include <cmath>
#include <limits>
#include <set>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace alphaflow
{
  using namespace boost::accumulators;

  namespace
  {
    const double NotANumber = std::numeric_limits<double>::quiet_NaN();

    typedef accumulator_set<double, stats<tag::rolling_mean>> RollingMeanAccumulator;

    std::string getParam (const IndicatorSpec& spec,
			  const std::string& key,
			  const std::string& defaultValue)
    {
      auto it = spec.params.find(key);
      if (it == spec.params.end())
	return defaultValue;

      return it->second;
    }

    uint32_t getPeriodParam (const IndicatorSpec& spec,
			     const std::string& key,
			     uint32_t defaultValue)
    {
      auto it = spec.params.find(key);
      if (it == spec.params.end())
	return defaultValue;

      long period;
      try
	{
	  period = boost::lexical_cast<long>(boost::algorithm::trim_copy(it->second));
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw IndicatorException("Indicator " + spec.name + ": parameter '" + key +
				   "' must be an integer, got '" + it->second + "'");
	}

      if (period <= 0)
	throw IndicatorException("Indicator " + spec.name + ": parameter '" + key +
				 "' must be positive, got " + std::to_string(period));

      return static_cast<uint32_t>(period);
    }

    void checkParams (const IndicatorSpec& spec, const std::set<std::string>& allowed)
    {
      for (const auto& param : spec.params)
	{
	  if (allowed.find(param.first) == allowed.end())
	    throw IndicatorException("Indicator " + spec.name + ": unknown parameter '" +
				     param.first + "'");
	}
    }

    const std::vector<double>& getPriceColumn (const PriceSeries& series,
					       const IndicatorSpec& spec)
    {
      const std::string priceCol(getParam(spec, "price_col", PriceSeries::CloseColumn));
      const std::vector<double>* column = series.findColumn(priceCol);

      if (column == nullptr)
	throw IndicatorException("Indicator " + spec.name + ": price column '" + priceCol +
				 "' does not exist");

      return *column;
    }

    std::string getOutputColumn (const IndicatorSpec& spec,
				 const std::string& key,
				 const std::string& defaultValue)
    {
      std::string name(getParam(spec, key, defaultValue));
      if (PriceSeries::isPriceColumn(name))
	throw IndicatorException("Indicator " + spec.name + ": output column '" + name +
				 "' would overwrite a price column");
      return name;
    }
  }

  std::vector<double> EmaSeries (const std::vector<double>& series, uint32_t period)
  {
    if (period == 0)
      throw IndicatorException("EmaSeries: period must be at least 1");

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    std::vector<double> result;
    result.reserve(series.size());

    bool seeded = false;
    double ema = NotANumber;

    for (double value : series)
      {
	if (std::isnan(value))
	  {
	    result.push_back(ema);
	    continue;
	  }

	if (!seeded)
	  {
	    ema = value;
	    seeded = true;
	  }
	else
	  ema = alpha * value + (1.0 - alpha) * ema;

	result.push_back(ema);
      }

    return result;
  }

  std::vector<double> RsiSeries (const std::vector<double>& series, uint32_t period)
  {
    if (period == 0)
      throw IndicatorException("RsiSeries: period must be at least 1");

    std::vector<double> result(series.size(), NotANumber);
    RollingMeanAccumulator gains(tag::rolling_window::window_size = period);
    RollingMeanAccumulator losses(tag::rolling_window::window_size = period);

    // Index of the most recent undefined price change; the first bar has none.
    std::size_t lastUndefined = 0;

    for (std::size_t i = 0; i < series.size(); ++i)
      {
	const double change = (i == 0) ? NotANumber : series[i] - series[i - 1];

	if (std::isnan(change))
	  {
	    lastUndefined = i;
	    gains(0.0);
	    losses(0.0);
	    continue;
	  }

	gains(change > 0.0 ? change : 0.0);
	losses(change < 0.0 ? -change : 0.0);

	if (i - lastUndefined < period)
	  continue;

	const double meanGain = rolling_mean(gains);
	const double meanLoss = rolling_mean(losses);

	if (meanLoss == 0.0)
	  result[i] = (meanGain > 0.0) ? 100.0 : NotANumber;
	else
	  result[i] = 100.0 - (100.0 / (1.0 + (meanGain / meanLoss)));
      }

    return result;
  }

  std::pair<std::vector<double>, std::vector<double>>
  MacdSeries (const std::vector<double>& series,
	      uint32_t fastPeriod,
	      uint32_t slowPeriod,
	      uint32_t signalPeriod)
  {
    std::vector<double> fast(EmaSeries(series, fastPeriod));
    std::vector<double> slow(EmaSeries(series, slowPeriod));

    std::vector<double> macd;
    macd.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
      macd.push_back(fast[i] - slow[i]);

    std::vector<double> signal(EmaSeries(macd, signalPeriod));
    return std::make_pair(std::move(macd), std::move(signal));
  }

  void IndicatorColumnProvider::addIndicatorColumns (PriceSeries& series, const IndicatorSpec& spec)
  {
    const std::string name(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(spec.name)));

    if (name == "ema")
      addEma(series, spec);
    else if (name == "rsi")
      addRsi(series, spec);
    else if (name == "macd")
      addMacd(series, spec);
    else
      throw IndicatorException("Unknown indicator '" + spec.name + "'");
  }

  PriceSeries IndicatorColumnProvider::applyIndicators (const PriceSeries& series,
							const std::vector<IndicatorSpec>& specs)
  {
    PriceSeries augmented(series);

    for (const auto& spec : specs)
      addIndicatorColumns(augmented, spec);

    return augmented;
  }

  void IndicatorColumnProvider::addEma (PriceSeries& series, const IndicatorSpec& spec)
  {
    checkParams(spec, {"period", "price_col", "out_col"});

    uint32_t period = getPeriodParam(spec, "period", 14);
    std::string outCol(getOutputColumn(spec, "out_col", "ema"));

    series.addColumn(outCol, EmaSeries(getPriceColumn(series, spec), period));
  }

  void IndicatorColumnProvider::addRsi (PriceSeries& series, const IndicatorSpec& spec)
  {
    checkParams(spec, {"period", "price_col", "out_col"});

    uint32_t period = getPeriodParam(spec, "period", 14);
    std::string outCol(getOutputColumn(spec, "out_col", "rsi"));

    series.addColumn(outCol, RsiSeries(getPriceColumn(series, spec), period));
  }

  void IndicatorColumnProvider::addMacd (PriceSeries& series, const IndicatorSpec& spec)
  {
    checkParams(spec, {"fast_period", "slow_period", "signal_period", "price_col",
		       "macd_col", "signal_col"});

    uint32_t fastPeriod = getPeriodParam(spec, "fast_period", 12);
    uint32_t slowPeriod = getPeriodParam(spec, "slow_period", 26);
    uint32_t signalPeriod = getPeriodParam(spec, "signal_period", 9);
    std::string macdCol(getOutputColumn(spec, "macd_col", "macd"));
    std::string signalCol(getOutputColumn(spec, "signal_col", "macd_signal"));

    if (macdCol == signalCol)
      throw IndicatorException("Indicator " + spec.name + ": macd_col and signal_col must differ");

    auto lines = MacdSeries(getPriceColumn(series, spec), fastPeriod, slowPeriod, signalPeriod);
    series.addColumn(macdCol, std::move(lines.first));
    series.addColumn(signalCol, std::move(lines.second));
  }
} // namespace alphaflow
