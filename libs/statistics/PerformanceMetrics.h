// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PERFORMANCE_METRICS_H
#define __PERFORMANCE_METRICS_H 1

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace alphaflow
{
  /**
   * @class PerformanceSummary
   * @brief Risk and return figures of one backtest run.
   *
   * Percent valued fields (win rate, drawdown percent, CAGR, volatility,
   * VaR) are expressed in percent, e.g. 12.5 for 12.5%. Beta is only present
   * when a benchmark return series was supplied.
   */
  class PerformanceSummary
  {
  public:
    PerformanceSummary();

    PerformanceSummary (std::size_t totalTrades,
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
			double finalBalance);

    std::size_t getTotalTrades() const
    {
      return mTotalTrades;
    }

    double getTotalPnl() const
    {
      return mTotalPnl;
    }

    double getWinRate() const
    {
      return mWinRate;
    }

    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    double getMaxDrawdownPercent() const
    {
      return mMaxDrawdownPercent;
    }

    double getCagr() const
    {
      return mCagr;
    }

    double getSharpeRatio() const
    {
      return mSharpeRatio;
    }

    double getSortinoRatio() const
    {
      return mSortinoRatio;
    }

    double getCalmarRatio() const
    {
      return mCalmarRatio;
    }

    double getVolatility() const
    {
      return mVolatility;
    }

    double getValueAtRisk95() const
    {
      return mValueAtRisk95;
    }

    const std::optional<double>& getBeta() const
    {
      return mBeta;
    }

    double getFinalBalance() const
    {
      return mFinalBalance;
    }

  private:
    std::size_t mTotalTrades;
    double mTotalPnl;
    double mWinRate;
    double mMaxDrawdown;
    double mMaxDrawdownPercent;
    double mCagr;
    double mSharpeRatio;
    double mSortinoRatio;
    double mCalmarRatio;
    double mVolatility;
    double mValueAtRisk95;
    std::optional<double> mBeta;
    double mFinalBalance;
  };

  /**
   * @struct PerformanceMetrics
   * @brief Pure metric functions over an equity curve and its bar returns.
   *
   * None of these functions throw. Inputs too short for a statistic, zero
   * variance and non-finite intermediate results all produce 0.0.
   */
  struct PerformanceMetrics
  {
    static constexpr double DefaultPeriodsPerYear = 252.0;

    /**
     * @brief Bar over bar returns v[i] / v[i-1] - 1.
     *
     * Steps whose result is not finite (previous value 0 or NaN input) are
     * dropped, so the result can be shorter than equityCurve.size() - 1.
     */
    static std::vector<double> computeReturns (const std::vector<double>& equityCurve);

    /**
     * @brief Compound annual growth rate in percent.
     *
     * years = equityCurve.size() / periodsPerYear. Returns 0 with fewer than
     * two points, a non-positive starting value or a non-finite result.
     */
    static double computeCagr (const std::vector<double>& equityCurve,
			       double periodsPerYear = DefaultPeriodsPerYear);

    /**
     * @brief Largest decline from a running peak.
     * @return pair of (currency drawdown, percent of peak drawdown); both 0 for an empty curve.
     */
    static std::pair<double, double> computeMaxDrawdown (const std::vector<double>& equityCurve);

    /**
     * @brief Largest decline from a running peak as a non-positive fraction,
     *        i.e. min(v / peak - 1).
     */
    static double computeMaxDrawdownFraction (const std::vector<double>& equityCurve);

    /// Annualized sample standard deviation of returns, in percent
    static double computeVolatility (const std::vector<double>& returns,
				     double periodsPerYear = DefaultPeriodsPerYear);

    static double computeSharpeRatio (const std::vector<double>& returns,
				      double riskFreeRate = 0.0,
				      double periodsPerYear = DefaultPeriodsPerYear);

    /**
     * @brief Like the Sharpe ratio with the sample deviation of the negative
     *        returns as denominator. Needs at least two negative returns.
     */
    static double computeSortinoRatio (const std::vector<double>& returns,
				       double riskFreeRate = 0.0,
				       double periodsPerYear = DefaultPeriodsPerYear);

    static double computeCalmarRatio (const std::vector<double>& equityCurve,
				      double periodsPerYear = DefaultPeriodsPerYear);

    /**
     * @brief Absolute 5th percentile of returns in percent (linear interpolation).
     */
    static double computeValueAtRisk95 (const std::vector<double>& returns);

    /**
     * @brief Sample covariance over population variance of the benchmark.
     *
     * When the lengths differ both series are trimmed to the shorter length,
     * keeping the most recent observations.
     */
    static double computeBeta (const std::vector<double>& strategyReturns,
			       const std::vector<double>& benchmarkReturns);

    /**
     * @brief Percentage of closed trades with strictly positive pnl.
     */
    static double computeWinRate (const std::vector<double>& closedTradePnls);

    /**
     * @brief Compute every metric of a run.
     *
     * @param equityCurve       balance at every bar.
     * @param closedTradePnls   pnl of every completed trade in order.
     * @param initialBalance    starting capital.
     * @param finalBalance      balance after the last bar.
     * @param maxDrawdown       currency drawdown tracked during simulation.
     * @param periodsPerYear    bars per year used for annualization.
     * @param riskFreeRate      annual risk free rate as a fraction.
     * @param benchmarkReturns  optional benchmark returns; beta is omitted when null.
     *
     * Beta pairs every bar step with the benchmark observation the same
     * distance from the end. A step dropped by computeReturns drops its
     * benchmark observation too.
     */
    static PerformanceSummary summarize (const std::vector<double>& equityCurve,
					 const std::vector<double>& closedTradePnls,
					 double initialBalance,
					 double finalBalance,
					 double maxDrawdown,
					 double periodsPerYear,
					 double riskFreeRate,
					 const std::vector<double>* benchmarkReturns);
  };
} // namespace alphaflow

#endif
