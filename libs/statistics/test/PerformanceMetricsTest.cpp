#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <vector>
#include "PerformanceMetrics.h"

using namespace alphaflow;

TEST_CASE("A constant equity curve has no risk or return", "[PerformanceMetrics]")
{
  std::vector<double> equity(10, 10000.0);
  std::vector<double> returns = PerformanceMetrics::computeReturns(equity);

  REQUIRE(returns.size() == 9);
  REQUIRE(PerformanceMetrics::computeSharpeRatio(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeSortinoRatio(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeVolatility(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeValueAtRisk95(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeMaxDrawdown(equity).first == 0.0);
  REQUIRE(PerformanceMetrics::computeMaxDrawdown(equity).second == 0.0);
  REQUIRE(PerformanceMetrics::computeCagr(equity) == 0.0);
  REQUIRE(PerformanceMetrics::computeCalmarRatio(equity) == 0.0);

  PerformanceSummary summary = PerformanceMetrics::summarize(equity, {}, 10000.0, 10000.0, 0.0,
							     252.0, 0.0, nullptr);
  REQUIRE(summary.getSharpeRatio() == 0.0);
  REQUIRE(summary.getVolatility() == 0.0);
  REQUIRE(summary.getMaxDrawdown() == 0.0);
  REQUIRE(summary.getMaxDrawdownPercent() == 0.0);
  REQUIRE(summary.getFinalBalance() == 10000.0);
  REQUIRE_FALSE(summary.getBeta().has_value());
}

TEST_CASE("computeReturns drops undefined steps", "[PerformanceMetrics]")
{
  REQUIRE(PerformanceMetrics::computeReturns({}).empty());
  REQUIRE(PerformanceMetrics::computeReturns({100.0}).empty());

  std::vector<double> returns = PerformanceMetrics::computeReturns({0.0, 100.0, 110.0});
  REQUIRE(returns.size() == 1);
  REQUIRE(returns[0] == Approx(0.1));
}

TEST_CASE("Drawdown measures decline from the running peak", "[PerformanceMetrics]")
{
  std::vector<double> equity{100.0, 110.0, 99.0, 105.0};

  auto drawdown = PerformanceMetrics::computeMaxDrawdown(equity);
  REQUIRE(drawdown.first == Approx(11.0));
  REQUIRE(drawdown.second == Approx(10.0));
  REQUIRE(PerformanceMetrics::computeMaxDrawdownFraction(equity) == Approx(-0.1));

  REQUIRE(PerformanceMetrics::computeMaxDrawdown({}).first == 0.0);
  REQUIRE(PerformanceMetrics::computeMaxDrawdownFraction({}) == 0.0);
}

TEST_CASE("CAGR uses the number of points as the elapsed periods", "[PerformanceMetrics]")
{
  std::vector<double> equity(252, 100.0);
  equity.back() = 110.0;

  REQUIRE(PerformanceMetrics::computeCagr(equity, 252.0) == Approx(10.0));

  // two years at 4 periods per year
  REQUIRE(PerformanceMetrics::computeCagr({100.0, 100.0, 100.0, 100.0, 100.0, 100.0, 100.0, 121.0}, 4.0) ==
	  Approx(10.0));

  SECTION("undefined cases")
    {
      REQUIRE(PerformanceMetrics::computeCagr({100.0}, 252.0) == 0.0);
      REQUIRE(PerformanceMetrics::computeCagr({0.0, 100.0}, 252.0) == 0.0);
      REQUIRE(PerformanceMetrics::computeCagr({100.0, 110.0}, 0.0) == 0.0);
      REQUIRE(PerformanceMetrics::computeCagr({100.0, -50.0}, 1.0) == 0.0);
    }
}

TEST_CASE("Volatility, Sharpe and VaR", "[PerformanceMetrics]")
{
  std::vector<double> returns = PerformanceMetrics::computeReturns({100.0, 110.0, 99.0});
  const double sd = std::sqrt(0.02);

  REQUIRE(PerformanceMetrics::computeVolatility(returns, 252.0) == Approx(sd * std::sqrt(252.0) * 100.0));
  REQUIRE(PerformanceMetrics::computeSharpeRatio(returns, 0.0, 252.0) == Approx(0.0).margin(1e-12));
  REQUIRE(PerformanceMetrics::computeValueAtRisk95(returns) == Approx(9.0));
}

TEST_CASE("Sharpe ratio subtracts the per period risk free rate", "[PerformanceMetrics]")
{
  std::vector<double> returns{0.01, 0.02, 0.03};

  REQUIRE(PerformanceMetrics::computeSharpeRatio(returns, 0.0, 252.0) ==
	  Approx(0.02 / 0.01 * std::sqrt(252.0)));
  REQUIRE(PerformanceMetrics::computeSharpeRatio(returns, 0.0252, 252.0) ==
	  Approx(0.0199 / 0.01 * std::sqrt(252.0)));
  REQUIRE(PerformanceMetrics::computeSharpeRatio({0.01}, 0.0, 252.0) == 0.0);
}

TEST_CASE("Sortino ratio uses downside deviation", "[PerformanceMetrics]")
{
  std::vector<double> returns{0.02, -0.01, -0.03, 0.04};
  const double downside = std::sqrt(0.0002);

  REQUIRE(PerformanceMetrics::computeSortinoRatio(returns, 0.0, 252.0) ==
	  Approx(0.005 / downside * std::sqrt(252.0)));

  SECTION("fewer than two negative returns")
    {
      REQUIRE(PerformanceMetrics::computeSortinoRatio({0.02, -0.01, 0.03}, 0.0, 252.0) == 0.0);
    }

  SECTION("identical negative returns")
    {
      REQUIRE(PerformanceMetrics::computeSortinoRatio({0.02, -0.01, -0.01}, 0.0, 252.0) == 0.0);
    }
}

TEST_CASE("Calmar ratio is CAGR over the drawdown fraction", "[PerformanceMetrics]")
{
  std::vector<double> equity{100.0, 120.0, 90.0, 121.0};

  // one year at 4 periods per year: CAGR 21%, drawdown 25%
  REQUIRE(PerformanceMetrics::computeCalmarRatio(equity, 4.0) == Approx(0.84));
  REQUIRE(PerformanceMetrics::computeCalmarRatio({100.0, 110.0, 120.0}, 3.0) == 0.0);
}

TEST_CASE("Beta against a benchmark", "[PerformanceMetrics]")
{
  std::vector<double> benchmark{0.01, -0.02, 0.03, 0.0};
  std::vector<double> strategy{0.02, -0.04, 0.06, 0.0};

  // sample covariance over population variance
  REQUIRE(PerformanceMetrics::computeBeta(strategy, benchmark) == Approx(2.0 * 4.0 / 3.0));

  SECTION("the longer series is trimmed to its most recent values")
    {
      std::vector<double> longer{0.5, -0.7, 0.02, -0.04, 0.06, 0.0};
      REQUIRE(PerformanceMetrics::computeBeta(longer, benchmark) == Approx(2.0 * 4.0 / 3.0));
    }

  SECTION("degenerate benchmarks")
    {
      REQUIRE(PerformanceMetrics::computeBeta(strategy, {0.5, 0.5, 0.5, 0.5}) == 0.0);
      REQUIRE(PerformanceMetrics::computeBeta(strategy, {0.01}) == 0.0);
      REQUIRE(PerformanceMetrics::computeBeta({}, benchmark) == 0.0);
    }
}

TEST_CASE("Win rate counts strictly positive trades", "[PerformanceMetrics]")
{
  REQUIRE(PerformanceMetrics::computeWinRate({5.0, -2.0, 0.0, 3.0}) == Approx(50.0));
  REQUIRE(PerformanceMetrics::computeWinRate({-5.0}) == 0.0);
  REQUIRE(PerformanceMetrics::computeWinRate({}) == 0.0);
}

TEST_CASE("summarize on an empty run", "[PerformanceMetrics]")
{
  std::vector<double> benchmark{0.01, 0.02};
  PerformanceSummary summary = PerformanceMetrics::summarize({}, {}, 10000.0, 10000.0, 0.0,
							     252.0, 0.0, &benchmark);

  REQUIRE(summary.getTotalTrades() == 0);
  REQUIRE(summary.getTotalPnl() == 0.0);
  REQUIRE(summary.getWinRate() == 0.0);
  REQUIRE(summary.getCagr() == 0.0);
  REQUIRE(summary.getSharpeRatio() == 0.0);
  REQUIRE(summary.getSortinoRatio() == 0.0);
  REQUIRE(summary.getCalmarRatio() == 0.0);
  REQUIRE(summary.getVolatility() == 0.0);
  REQUIRE(summary.getValueAtRisk95() == 0.0);
  REQUIRE(summary.getBeta().has_value());
  REQUIRE(*summary.getBeta() == 0.0);
  REQUIRE(summary.getFinalBalance() == 10000.0);
}

TEST_CASE("summarize never reports non-finite values", "[PerformanceMetrics]")
{
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<double> equity{100.0, inf, 100.0};

  PerformanceSummary summary = PerformanceMetrics::summarize(equity, {}, 100.0, 100.0, 0.0,
							     252.0, 0.0, nullptr);

  REQUIRE(std::isfinite(summary.getCagr()));
  REQUIRE(std::isfinite(summary.getSharpeRatio()));
  REQUIRE(std::isfinite(summary.getVolatility()));
  REQUIRE(std::isfinite(summary.getMaxDrawdown()));
  REQUIRE(std::isfinite(summary.getMaxDrawdownPercent()));
  REQUIRE(std::isfinite(summary.getCalmarRatio()));
  REQUIRE(std::isfinite(summary.getValueAtRisk95()));
}

TEST_CASE("A single point equity curve has no risk or return", "[PerformanceMetrics]")
{
  std::vector<double> equity{10000.0};
  std::vector<double> returns = PerformanceMetrics::computeReturns(equity);

  REQUIRE(returns.empty());
  REQUIRE(PerformanceMetrics::computeSharpeRatio(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeSortinoRatio(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeVolatility(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeValueAtRisk95(returns) == 0.0);
  REQUIRE(PerformanceMetrics::computeCalmarRatio(equity) == 0.0);
  REQUIRE(PerformanceMetrics::computeCagr(equity) == 0.0);

  PerformanceSummary summary = PerformanceMetrics::summarize(equity, {}, 10000.0, 10000.0, 0.0,
							     252.0, 0.0, nullptr);
  REQUIRE(summary.getCagr() == 0.0);
  REQUIRE(summary.getSharpeRatio() == 0.0);
  REQUIRE(summary.getSortinoRatio() == 0.0);
  REQUIRE(summary.getCalmarRatio() == 0.0);
  REQUIRE(summary.getVolatility() == 0.0);
  REQUIRE(summary.getValueAtRisk95() == 0.0);
  REQUIRE(summary.getMaxDrawdown() == 0.0);
  REQUIRE(summary.getMaxDrawdownPercent() == 0.0);
}

TEST_CASE("summarize keeps benchmark pairing when a step is undefined", "[PerformanceMetrics]")
{
  // Steps: 0.1, -1.0, inf (dropped), 0.2
  std::vector<double> equity{100.0, 110.0, 0.0, 50.0, 60.0};
  std::vector<double> benchmark{0.05, -0.5, 0.9, 0.1};

  PerformanceSummary summary = PerformanceMetrics::summarize(equity, {}, 100.0, 60.0, 110.0,
							     252.0, 0.0, &benchmark);

  // Remaining strategy steps are twice their benchmark observations:
  // sample covariance / population variance = 2 * 3 / 2
  REQUIRE(summary.getBeta().has_value());
  REQUIRE(*summary.getBeta() == Approx(3.0));
}
