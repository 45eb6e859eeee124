#include <catch2/catch.hpp>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>
#include "TradeSimulator.h"
#include "TestUtils.h"

using namespace alphaflow;

namespace
{
  class RecordingObserver : public SimulationObserver
  {
  public:
    void PositionOpened (const LedgerEntry& entry)
    {
      mEvents.push_back(entry);
    }

    void PositionClosed (const LedgerEntry& exit)
    {
      mEvents.push_back(exit);
    }

    const std::vector<LedgerEntry>& getEvents() const
    {
      return mEvents;
    }

  private:
    std::vector<LedgerEntry> mEvents;
  };

  ExecutionParameters limitOrders()
  {
    return ExecutionParameters(OrderType::LIMIT, 10000.0, 1.0);
  }
}

TEST_CASE("Single losing round trip with market orders", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({100.0, 105.0, 95.0}));
  TradeSimulator simulator(ExecutionParameters(OrderType::MARKET, 10000.0, 1.0));

  SimulationResult result = simulator.run(series, {true, false, false}, {false, false, true});

  REQUIRE(result.getLedger().size() == 2);

  const LedgerEntry& entry = result.getLedger()[0];
  REQUIRE(entry.isEntry());
  REQUIRE(entry.getPrice() == 100.0);
  REQUIRE(entry.getBarIndex() == 0);
  REQUIRE(entry.getDateTime() == barTime(0));
  REQUIRE_FALSE(entry.getPnl().has_value());
  REQUIRE_FALSE(entry.getBalance().has_value());

  const LedgerEntry& exit = result.getLedger()[1];
  REQUIRE(exit.isExit());
  REQUIRE(exit.getPrice() == 95.0);
  REQUIRE(exit.getBarIndex() == 2);
  REQUIRE(exit.getDateTime() == barTime(2));
  REQUIRE(*exit.getPnl() == -5.0);
  REQUIRE(*exit.getBalance() == 9995.0);

  REQUIRE(result.getFinalBalance() == 9995.0);
  REQUIRE(result.getTotalPnl() == -5.0);
  REQUIRE(result.getNumTrades() == 1);
  REQUIRE(result.getClosedTradePnls() == std::vector<double>{-5.0});
  REQUIRE(result.getEquityCurve() == std::vector<double>{10000.0, 10000.0, 9995.0});
  REQUIRE(result.getMaxDrawdown() == 5.0);
  REQUIRE_FALSE(result.isPositionOpen());
}

TEST_CASE("An empty series produces an empty run", "[TradeSimulator]")
{
  PriceSeries series;
  TradeSimulator simulator(ExecutionParameters{});

  SimulationResult result = simulator.run(series, {}, {});

  REQUIRE(result.getLedger().empty());
  REQUIRE(result.getEquityCurve().empty());
  REQUIRE(result.getFinalBalance() == 10000.0);
  REQUIRE(result.getInitialBalance() == 10000.0);
  REQUIRE(result.getNumTrades() == 0);
  REQUIRE(result.getMaxDrawdown() == 0.0);
}

TEST_CASE("Limit orders fill at the next bar's open", "[TradeSimulator]")
{
  PriceSeries series(createOpenCloseSeries({100.0, 101.0, 104.0, 108.0},
					   {100.5, 103.0, 107.0, 110.0}));
  TradeSimulator simulator(limitOrders());

  SECTION("fill on the following open, recorded on the signalling bar")
    {
      SimulationResult result = simulator.run(series, {true, false, false, false},
					      {false, true, false, false});

      REQUIRE(result.getLedger().size() == 2);
      REQUIRE(result.getLedger()[0].getPrice() == 101.0);
      REQUIRE(result.getLedger()[0].getBarIndex() == 0);
      REQUIRE(result.getLedger()[0].getDateTime() == barTime(0));
      REQUIRE(result.getLedger()[1].getPrice() == 104.0);
      REQUIRE(result.getLedger()[1].getBarIndex() == 1);
      REQUIRE(*result.getLedger()[1].getPnl() == 3.0);
    }

  SECTION("a signal on the last bar falls back to its close")
    {
      SimulationResult result = simulator.run(series, {false, false, true, false},
					      {false, false, false, true});

      REQUIRE(result.getLedger()[0].getPrice() == 108.0);
      REQUIRE(result.getLedger()[1].getPrice() == 110.0);
      REQUIRE(*result.getLedger()[1].getPnl() == 2.0);
      REQUIRE(result.getFinalBalance() == 10002.0);
    }
}

TEST_CASE("Entry is only considered while flat and exit only while long", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({10.0, 11.0, 12.0, 13.0}));
  TradeSimulator simulator(ExecutionParameters{});

  SECTION("exit signal while flat is ignored")
    {
      SimulationResult result = simulator.run(series, {false, false, false, false},
					      {true, true, true, true});
      REQUIRE(result.getLedger().empty());
    }

  SECTION("entry and exit on the same bar never round trip")
    {
      SimulationResult result = simulator.run(series, {true, true, true, true},
					      {true, true, true, true});

      // entry bar 0, exit bar 1, entry bar 2, exit bar 3
      REQUIRE(result.getLedger().size() == 4);
      REQUIRE(result.getLedger()[0].isEntry());
      REQUIRE(result.getLedger()[0].getBarIndex() == 0);
      REQUIRE(result.getLedger()[1].isExit());
      REQUIRE(result.getLedger()[1].getBarIndex() == 1);
      REQUIRE(result.getLedger()[2].isEntry());
      REQUIRE(result.getLedger()[2].getBarIndex() == 2);
      REQUIRE(result.getLedger()[3].isExit());
      REQUIRE(result.getLedger()[3].getBarIndex() == 3);
      REQUIRE(result.getFinalBalance() == 10002.0);
    }

  SECTION("repeated entry signals while long do not pyramid")
    {
      SimulationResult result = simulator.run(series, {true, true, true, false},
					      {false, false, false, true});
      REQUIRE(result.getLedger().size() == 2);
      REQUIRE(*result.getLedger()[1].getPnl() == 3.0);
    }
}

TEST_CASE("A position still open at the end is not marked to market", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({10.0, 20.0, 30.0}));
  TradeSimulator simulator(ExecutionParameters{});

  SimulationResult result = simulator.run(series, {false, true, false}, {false, false, false});

  REQUIRE(result.getLedger().size() == 1);
  REQUIRE(result.isPositionOpen());
  REQUIRE(result.getNumTrades() == 0);
  REQUIRE(result.getFinalBalance() == 10000.0);
  REQUIRE(result.getEquityCurve() == std::vector<double>{10000.0, 10000.0, 10000.0});
}

TEST_CASE("Balance accumulates across trades and scales with position size", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({10.0, 14.0, 12.0, 11.0, 9.0, 10.0}));
  TradeSimulator simulator(ExecutionParameters(OrderType::MARKET, 1000.0, 2.0));

  SimulationResult result = simulator.run(series,
					  {true, false, true, false, false, false},
					  {false, true, false, false, true, false});

  // +4 * 2 then -3 * 2
  REQUIRE(result.getClosedTradePnls() == std::vector<double>{8.0, -6.0});
  REQUIRE(result.getEquityCurve() ==
	  std::vector<double>{1000.0, 1008.0, 1008.0, 1008.0, 1002.0, 1002.0});
  REQUIRE(result.getFinalBalance() == 1002.0);
  REQUIRE(result.getTotalPnl() == 2.0);
  REQUIRE(result.getMaxDrawdown() == 6.0);

  // balance of every exit equals the initial balance plus the pnls so far
  double expected = 1000.0;
  for (auto it = result.beginLedger(); it != result.endLedger(); ++it)
    {
      if (it->isExit())
	{
	  expected += *it->getPnl();
	  REQUIRE(*it->getBalance() == expected);
	}
    }
}

TEST_CASE("Ledger alternates entry and exit in bar order", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0}));
  TradeSimulator simulator(ExecutionParameters{});

  SimulationResult result = simulator.run(series,
					  {true, false, true, true, false, true, false, true},
					  {false, true, true, false, true, true, true, false});

  std::size_t lastBar = 0;
  for (std::size_t i = 0; i < result.getLedger().size(); ++i)
    {
      const LedgerEntry& record = result.getLedger()[i];
      REQUIRE(record.isEntry() == (i % 2 == 0));
      if (i > 0)
	REQUIRE(record.getBarIndex() > lastBar);
      lastBar = record.getBarIndex();
    }
}

TEST_CASE("Simulation is deterministic", "[TradeSimulator]")
{
  PriceSeries series(createOpenCloseSeries({5.0, 6.0, 7.0, 6.5, 8.0}, {5.5, 6.5, 6.8, 7.0, 8.5}));
  TradeSimulator simulator(limitOrders());
  std::vector<bool> entry{true, false, false, true, false};
  std::vector<bool> exit{false, false, true, false, true};

  SimulationResult first = simulator.run(series, entry, exit);
  SimulationResult second = simulator.run(series, entry, exit);

  REQUIRE(first.getLedger() == second.getLedger());
  REQUIRE(first.getEquityCurve() == second.getEquityCurve());
  REQUIRE(first.getFinalBalance() == second.getFinalBalance());
}

TEST_CASE("Signal lengths must match the series", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({1.0, 2.0, 3.0}));
  TradeSimulator simulator(ExecutionParameters{});

  REQUIRE_THROWS_AS(simulator.run(series, {true, false}, {false, false, false}), SignalAlignmentError);
  REQUIRE_THROWS_AS(simulator.run(series, {true, false, false}, {false}), SignalAlignmentError);
}

TEST_CASE("Stop loss and take profit do not alter the simulation", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({100.0, 50.0, 200.0, 150.0}));
  ExecutionParameters withStops;
  withStops.setStopLoss(0.01);
  withStops.setTakeProfit(0.02);

  std::vector<bool> entry{true, false, false, false};
  std::vector<bool> exit{false, false, false, true};

  SimulationResult plain = TradeSimulator(ExecutionParameters{}).run(series, entry, exit);
  SimulationResult stopped = TradeSimulator(withStops).run(series, entry, exit);

  REQUIRE(plain.getLedger() == stopped.getLedger());
  REQUIRE(*stopped.getLedger()[1].getPnl() == 50.0);
}

TEST_CASE("Observers see every position transition", "[TradeSimulator]")
{
  PriceSeries series(createCloseSeries({100.0, 105.0, 95.0}));
  TradeSimulator simulator(ExecutionParameters{});
  auto observer = std::make_shared<RecordingObserver>();
  simulator.addObserver(observer);

  SimulationResult result = simulator.run(series, {true, false, false}, {false, false, true});

  REQUIRE(observer->getEvents() == result.getLedger());
}

TEST_CASE("ExecutionParameters", "[ExecutionParameters]")
{
  ExecutionParameters defaults;
  REQUIRE(defaults.getOrderType() == OrderType::MARKET);
  REQUIRE(defaults.getInitialBalance() == 10000.0);
  REQUIRE(defaults.getPositionSize() == 1.0);
  REQUIRE(defaults.getPeriodsPerYear() == 252.0);
  REQUIRE(defaults.getRiskFreeRate() == 0.0);
  REQUIRE_FALSE(defaults.getStopLoss().has_value());
  REQUIRE_FALSE(defaults.getTakeProfit().has_value());

  REQUIRE_THROWS_AS(ExecutionParameters(OrderType::MARKET, std::nan(""), 1.0), std::domain_error);
  REQUIRE_THROWS_AS(ExecutionParameters(OrderType::MARKET, 1000.0, 1.0, 0.0), std::domain_error);
  REQUIRE_THROWS_AS(defaults.setStopLoss(std::nan("")), std::domain_error);
}

TEST_CASE("OrderType names", "[OrderType]")
{
  REQUIRE(orderTypeFromString("market") == OrderType::MARKET);
  REQUIRE(orderTypeFromString(" LIMIT ") == OrderType::LIMIT);
  REQUIRE(orderTypeToString(OrderType::LIMIT) == "limit");
  REQUIRE(orderTypeToString(OrderType::MARKET) == "market");
  REQUIRE_THROWS_AS(orderTypeFromString("stop"), std::invalid_argument);
}
