// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_SERIES_INDICATORS_H
#define __TIME_SERIES_INDICATORS_H 1

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "TimeSeriesException.h"

namespace alphaflow
{
  class IndicatorException : public AlphaFlowException
  {
  public:
    explicit IndicatorException(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

  /**
   * @brief Exponential moving average with smoothing factor 2 / (period + 1).
   *
   * The average is seeded with the first finite input value and updated
   * recursively (no bias adjustment). Leading NaN inputs produce NaN; a NaN
   * after the seed carries the previous average forward.
   *
   * @param series The input values.
   * @param period The span of the average, must be at least 1.
   * @return A vector of the same length as the input.
   * @throws IndicatorException if period is zero.
   */
  std::vector<double> EmaSeries (const std::vector<double>& series, uint32_t period);

  /**
   * @brief Relative strength index using simple rolling means of gains and losses.
   *
   * RSI = 100 - 100 / (1 + meanGain / meanLoss) over the last `period` price
   * changes. The first `period` values are NaN because fewer than `period`
   * changes are available. A window with no losses and some gains yields 100;
   * a window with neither yields NaN.
   *
   * @throws IndicatorException if period is zero.
   */
  std::vector<double> RsiSeries (const std::vector<double>& series, uint32_t period);

  /**
   * @brief MACD line (fast EMA minus slow EMA) and its signal line.
   * @return pair of (macd, signal) vectors of the same length as the input.
   */
  std::pair<std::vector<double>, std::vector<double>>
  MacdSeries (const std::vector<double>& series,
	      uint32_t fastPeriod,
	      uint32_t slowPeriod,
	      uint32_t signalPeriod);

  /**
   * @struct IndicatorSpec
   * @brief Name and parameters of one indicator computation, e.g.
   *        {"ema", {{"period","20"},{"out_col","ema_20"}}}.
   */
  struct IndicatorSpec
  {
    IndicatorSpec()
      : name(),
	params()
    {}

    IndicatorSpec(const std::string& indicatorName,
		  const std::map<std::string, std::string>& indicatorParams)
      : name(indicatorName),
	params(indicatorParams)
    {}

    std::string name;
    std::map<std::string, std::string> params;
  };

  /**
   * @class IndicatorColumnProvider
   * @brief Appends the columns produced by an indicator specification to a price series.
   *
   * Supported indicators (names are case insensitive):
   * - ema:  period (14), price_col (close), out_col (ema)
   * - rsi:  period (14), price_col (close), out_col (rsi)
   * - macd: fast_period (12), slow_period (26), signal_period (9), price_col (close),
   *         macd_col (macd), signal_col (macd_signal)
   */
  class IndicatorColumnProvider
  {
  public:
    /**
     * @brief Compute the indicator and add its output column(s) to series.
     * @throws IndicatorException on unknown indicator names, unknown parameters,
     *         invalid periods or a missing price column.
     */
    static void addIndicatorColumns (PriceSeries& series, const IndicatorSpec& spec);

    /**
     * @brief Copy series and append the columns of every spec in order.
     */
    static PriceSeries applyIndicators (const PriceSeries& series,
					const std::vector<IndicatorSpec>& specs);

  private:
    static void addEma (PriceSeries& series, const IndicatorSpec& spec);
    static void addRsi (PriceSeries& series, const IndicatorSpec& spec);
    static void addMacd (PriceSeries& series, const IndicatorSpec& spec);
  };
} // namespace alphaflow

#endif
