#include <catch2/catch.hpp>
#include <memory>
#include <vector>
#include "BackTester.h"
#include "ExpressionException.h"
#include "TestUtils.h"

using namespace alphaflow;

namespace
{
  class CountingObserver : public SimulationObserver
  {
  public:
    CountingObserver()
      : mOpened(0),
	mClosed(0)
    {}

    void PositionOpened (const LedgerEntry&)
    {
      mOpened++;
    }

    void PositionClosed (const LedgerEntry&)
    {
      mClosed++;
    }

    int mOpened;
    int mClosed;
  };

  PriceSeries pipelineSeries()
  {
    return createCloseSeries({10.0, 12.0, 15.0, 11.0, 9.0, 13.0});
  }

  BacktestRequest pipelineRequest (const std::string& entryLogic = "COND1",
				   const std::string& exitLogic = "cond2")
  {
    return BacktestRequest({IndicatorSpec("ema", {{"period", "1"}, {"out_col", "ema_1"}})},
			   {"ema_1 > 11", "close < 10"},
			   entryLogic,
			   exitLogic,
			   ExecutionParameters{});
  }
}

TEST_CASE("BackTester runs indicators, conditions, logic and simulation", "[BackTester]")
{
  BackTester backTester(pipelineSeries(), pipelineRequest());
  BacktestResult result = backTester.backtest();

  const SimulationResult& simulation = result.getSimulationResult();
  REQUIRE(simulation.getLedger().size() == 3);
  REQUIRE(simulation.getLedger()[0].getBarIndex() == 1);
  REQUIRE(simulation.getLedger()[0].getPrice() == 12.0);
  REQUIRE(simulation.getLedger()[1].getBarIndex() == 4);
  REQUIRE(*simulation.getLedger()[1].getPnl() == -3.0);
  REQUIRE(simulation.getLedger()[2].isEntry());
  REQUIRE(simulation.isPositionOpen());

  const PerformanceSummary& summary = result.getPerformanceSummary();
  REQUIRE(summary.getTotalTrades() == 1);
  REQUIRE(summary.getTotalPnl() == -3.0);
  REQUIRE(summary.getWinRate() == 0.0);
  REQUIRE(summary.getFinalBalance() == 9997.0);
  REQUIRE(summary.getMaxDrawdown() == 3.0);
  REQUIRE(summary.getMaxDrawdownPercent() == Approx(0.03));
  REQUIRE_FALSE(summary.getBeta().has_value());
}

TEST_CASE("BackTester reports benchmark beta when given returns", "[BackTester]")
{
  BackTester backTester(pipelineSeries(), pipelineRequest());
  backTester.setBenchmarkReturns({0.01, -0.02, 0.01, 0.03, -0.01});

  BacktestResult result = backTester.backtest();
  REQUIRE(result.getPerformanceSummary().getBeta().has_value());
}

TEST_CASE("BackTester notifies observers", "[BackTester]")
{
  BackTester backTester(pipelineSeries(), pipelineRequest());
  auto observer = std::make_shared<CountingObserver>();
  backTester.addObserver(observer);

  backTester.backtest();

  REQUIRE(observer->mOpened == 2);
  REQUIRE(observer->mClosed == 1);
}

TEST_CASE("BackTester propagates evaluation errors", "[BackTester]")
{
  SECTION("unknown condition in the entry logic")
    {
      BackTester backTester(pipelineSeries(), pipelineRequest("COND1 AND COND3"));
      REQUIRE_THROWS_AS(backTester.backtest(), UnknownConditionError);
    }

  SECTION("syntax error in the exit logic")
    {
      BackTester backTester(pipelineSeries(), pipelineRequest("COND1", "COND2 OR"));
      REQUIRE_THROWS_AS(backTester.backtest(), ExpressionSyntaxError);
    }

  SECTION("condition over a column no indicator produced")
    {
      BacktestRequest request({}, {"ema_1 > 11"}, "COND1", "COND1", ExecutionParameters{});
      BackTester backTester(pipelineSeries(), request);
      REQUIRE_THROWS_AS(backTester.backtest(), UnknownColumnError);
    }
}

TEST_CASE("BackTester does not modify the caller's series", "[BackTester]")
{
  PriceSeries series(pipelineSeries());
  BackTester backTester(series, pipelineRequest());
  backTester.backtest();

  REQUIRE_FALSE(series.hasColumn("ema_1"));
}

TEST_CASE("simulate computes metrics for precomputed signals", "[BackTester]")
{
  PriceSeries series(createCloseSeries({100.0, 105.0, 95.0}));
  BacktestResult result = simulate(series, {true, false, false}, {false, false, true},
				   ExecutionParameters{});

  REQUIRE(result.getPerformanceSummary().getTotalTrades() == 1);
  REQUIRE(result.getPerformanceSummary().getWinRate() == 0.0);
  REQUIRE(result.getPerformanceSummary().getFinalBalance() == 9995.0);
  REQUIRE(result.getPerformanceSummary().getTotalPnl() == -5.0);

  SECTION("empty series")
    {
      BacktestResult empty = simulate(PriceSeries(), {}, {}, ExecutionParameters{});
      REQUIRE(empty.getSimulationResult().getLedger().empty());
      REQUIRE(empty.getPerformanceSummary().getTotalTrades() == 0);
      REQUIRE(empty.getPerformanceSummary().getFinalBalance() == 10000.0);
      REQUIRE(empty.getPerformanceSummary().getSharpeRatio() == 0.0);
      REQUIRE(empty.getPerformanceSummary().getMaxDrawdown() == 0.0);
      REQUIRE(empty.getPerformanceSummary().getCagr() == 0.0);
    }
}
