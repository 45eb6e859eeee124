// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PerformanceMetrics.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include "StatUtils.h"

namespace alphaflow
{
  namespace
  {
    double finiteOrZero (double value)
    {
      return std::isfinite (value) ? value : 0.0;
    }

    bool validPeriodsPerYear (double periodsPerYear)
    {
      return std::isfinite (periodsPerYear) && (periodsPerYear > 0.0);
    }

    double meanExcessReturn (const std::vector<double>& returns,
			     double riskFreeRate,
			     double periodsPerYear)
    {
      const double riskFreePerPeriod = riskFreeRate / periodsPerYear;
      return StatUtils::computeMean (returns) - riskFreePerPeriod;
    }

    // Pairs each bar step with the benchmark observation at the same distance
    // from the end, then drops the pairs whose step is not finite.
    double computeAlignedBeta (const std::vector<double>& equityCurve,
			       const std::vector<double>& benchmarkReturns)
    {
      if (equityCurve.size() < 2)
	return 0.0;

      const std::size_t steps = equityCurve.size() - 1;
      const std::size_t n = std::min (steps, benchmarkReturns.size());
      const std::size_t firstStep = steps - n;
      const std::size_t firstBenchmark = benchmarkReturns.size() - n;

      std::vector<double> strategy;
      std::vector<double> benchmark;
      strategy.reserve (n);
      benchmark.reserve (n);

      for (std::size_t k = 0; k < n; ++k)
	{
	  const std::size_t i = firstStep + k + 1;
	  double r = equityCurve[i] / equityCurve[i - 1] - 1.0;
	  if (!std::isfinite (r))
	    continue;

	  strategy.push_back (r);
	  benchmark.push_back (benchmarkReturns[firstBenchmark + k]);
	}

      return PerformanceMetrics::computeBeta (strategy, benchmark);
    }
  }

  PerformanceSummary::PerformanceSummary()
    : mTotalTrades(0),
      mTotalPnl(0.0),
      mWinRate(0.0),
      mMaxDrawdown(0.0),
      mMaxDrawdownPercent(0.0),
      mCagr(0.0),
      mSharpeRatio(0.0),
      mSortinoRatio(0.0),
      mCalmarRatio(0.0),
      mVolatility(0.0),
      mValueAtRisk95(0.0),
      mBeta(),
      mFinalBalance(0.0)
  {}

  PerformanceSummary::PerformanceSummary (std::size_t totalTrades,
					  double totalPnl,
					  double winRate,
					  double maxDrawdown,
					  double maxDrawdownPercent,
					  double cagr,
					  double sharpeRatio,
					  double sortinoRatio,
					  double calmarRatio,
					  double volatility,
					  double valueAtRisk95,
					  const std::optional<double>& beta,
					  double finalBalance)
    : mTotalTrades(totalTrades),
      mTotalPnl(totalPnl),
      mWinRate(winRate),
      mMaxDrawdown(maxDrawdown),
      mMaxDrawdownPercent(maxDrawdownPercent),
      mCagr(cagr),
      mSharpeRatio(sharpeRatio),
      mSortinoRatio(sortinoRatio),
      mCalmarRatio(calmarRatio),
      mVolatility(volatility),
      mValueAtRisk95(valueAtRisk95),
      mBeta(beta),
      mFinalBalance(finalBalance)
  {}

  std::vector<double> PerformanceMetrics::computeReturns (const std::vector<double>& equityCurve)
  {
    std::vector<double> returns;
    if (equityCurve.size() < 2)
      return returns;

    returns.reserve (equityCurve.size() - 1);
    for (std::size_t i = 1; i < equityCurve.size(); ++i)
      {
	double r = equityCurve[i] / equityCurve[i - 1] - 1.0;
	if (std::isfinite (r))
	  returns.push_back (r);
      }

    return returns;
  }

  double PerformanceMetrics::computeCagr (const std::vector<double>& equityCurve,
					  double periodsPerYear)
  {
    if (equityCurve.size() < 2 || !validPeriodsPerYear (periodsPerYear))
      return 0.0;

    const double start = equityCurve.front();
    const double end = equityCurve.back();
    const double years = static_cast<double>(equityCurve.size()) / periodsPerYear;

    if (!(start > 0.0) || !(years > 0.0))
      return 0.0;

    return finiteOrZero ((std::pow (end / start, 1.0 / years) - 1.0) * 100.0);
  }

  std::pair<double, double> PerformanceMetrics::computeMaxDrawdown (const std::vector<double>& equityCurve)
  {
    if (equityCurve.empty())
      return std::make_pair (0.0, 0.0);

    double peak = equityCurve.front();
    double maxDrawdown = 0.0;
    double maxDrawdownPercent = 0.0;

    for (double value : equityCurve)
      {
	peak = std::max (peak, value);

	const double drawdown = peak - value;
	maxDrawdown = std::max (maxDrawdown, drawdown);

	if (peak > 0.0)
	  maxDrawdownPercent = std::max (maxDrawdownPercent, drawdown / peak * 100.0);
      }

    return std::make_pair (finiteOrZero (maxDrawdown), finiteOrZero (maxDrawdownPercent));
  }

  double PerformanceMetrics::computeMaxDrawdownFraction (const std::vector<double>& equityCurve)
  {
    if (equityCurve.empty())
      return 0.0;

    double peak = equityCurve.front();
    double worst = 0.0;

    for (double value : equityCurve)
      {
	peak = std::max (peak, value);
	if (peak > 0.0)
	  worst = std::min (worst, value / peak - 1.0);
      }

    return finiteOrZero (worst);
  }

  double PerformanceMetrics::computeVolatility (const std::vector<double>& returns,
						double periodsPerYear)
  {
    if (returns.size() < 2 || !validPeriodsPerYear (periodsPerYear))
      return 0.0;

    return finiteOrZero (StatUtils::computeStdDev (returns) * std::sqrt (periodsPerYear) * 100.0);
  }

  double PerformanceMetrics::computeSharpeRatio (const std::vector<double>& returns,
						 double riskFreeRate,
						 double periodsPerYear)
  {
    if (returns.size() < 2 || !validPeriodsPerYear (periodsPerYear))
      return 0.0;

    const double sd = StatUtils::computeStdDev (returns);
    if (sd == 0.0)
      return 0.0;

    return finiteOrZero (meanExcessReturn (returns, riskFreeRate, periodsPerYear) / sd *
			 std::sqrt (periodsPerYear));
  }

  double PerformanceMetrics::computeSortinoRatio (const std::vector<double>& returns,
						  double riskFreeRate,
						  double periodsPerYear)
  {
    if (returns.size() < 2 || !validPeriodsPerYear (periodsPerYear))
      return 0.0;

    std::vector<double> negativeReturns;
    std::copy_if (returns.begin(), returns.end(), std::back_inserter (negativeReturns),
		  [](double r) { return r < 0.0; });

    if (negativeReturns.size() < 2)
      return 0.0;

    const double downside = StatUtils::computeStdDev (negativeReturns);
    if (downside == 0.0)
      return 0.0;

    return finiteOrZero (meanExcessReturn (returns, riskFreeRate, periodsPerYear) / downside *
			 std::sqrt (periodsPerYear));
  }

  double PerformanceMetrics::computeCalmarRatio (const std::vector<double>& equityCurve,
						 double periodsPerYear)
  {
    const double drawdown = std::fabs (computeMaxDrawdownFraction (equityCurve));
    if (drawdown == 0.0)
      return 0.0;

    return finiteOrZero ((computeCagr (equityCurve, periodsPerYear) / 100.0) / drawdown);
  }

  double PerformanceMetrics::computeValueAtRisk95 (const std::vector<double>& returns)
  {
    if (returns.empty())
      return 0.0;

    return finiteOrZero (std::fabs (StatUtils::quantile (returns, 0.05)) * 100.0);
  }

  double PerformanceMetrics::computeBeta (const std::vector<double>& strategyReturns,
					  const std::vector<double>& benchmarkReturns)
  {
    const std::size_t n = std::min (strategyReturns.size(), benchmarkReturns.size());
    if (n < 2)
      return 0.0;

    // Keep the most recent n observations of each series
    std::vector<double> strategy (strategyReturns.end() - static_cast<std::ptrdiff_t>(n),
				  strategyReturns.end());
    std::vector<double> benchmark (benchmarkReturns.end() - static_cast<std::ptrdiff_t>(n),
				   benchmarkReturns.end());

    const double benchmarkVariance = StatUtils::computePopulationVariance (benchmark);
    if (!(benchmarkVariance > 0.0))
      return 0.0;

    return finiteOrZero (StatUtils::computeCovariance (strategy, benchmark) / benchmarkVariance);
  }

  double PerformanceMetrics::computeWinRate (const std::vector<double>& closedTradePnls)
  {
    if (closedTradePnls.empty())
      return 0.0;

    auto winners = std::count_if (closedTradePnls.begin(), closedTradePnls.end(),
				  [](double pnl) { return pnl > 0.0; });

    return 100.0 * static_cast<double>(winners) / static_cast<double>(closedTradePnls.size());
  }

  PerformanceSummary PerformanceMetrics::summarize (const std::vector<double>& equityCurve,
						    const std::vector<double>& closedTradePnls,
						    double initialBalance,
						    double finalBalance,
						    double maxDrawdown,
						    double periodsPerYear,
						    double riskFreeRate,
						    const std::vector<double>* benchmarkReturns)
  {
    const std::vector<double> returns (computeReturns (equityCurve));

    std::optional<double> beta;
    if (benchmarkReturns != nullptr)
      beta = computeAlignedBeta (equityCurve, *benchmarkReturns);

    return PerformanceSummary (closedTradePnls.size(),
			       finalBalance - initialBalance,
			       computeWinRate (closedTradePnls),
			       maxDrawdown,
			       computeMaxDrawdown (equityCurve).second,
			       computeCagr (equityCurve, periodsPerYear),
			       computeSharpeRatio (returns, riskFreeRate, periodsPerYear),
			       computeSortinoRatio (returns, riskFreeRate, periodsPerYear),
			       computeCalmarRatio (equityCurve, periodsPerYear),
			       computeVolatility (returns, periodsPerYear),
			       computeValueAtRisk95 (returns),
			       beta,
			       finalBalance);
  }
} // namespace alphaflow
