// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TradeSimulator.h"
#include <algorithm>
#include <utility>
#include "TimeSeriesException.h"

namespace alphaflow
{
  std::string tradeActionToString (TradeAction action)
  {
    return (action == TradeAction::ENTRY) ? "entry" : "exit";
  }

  LedgerEntry::LedgerEntry (TradeAction action,
			    double price,
			    const ptime& dateTime,
			    std::size_t barIndex,
			    const std::optional<double>& pnl,
			    const std::optional<double>& balance)
    : mAction(action),
      mPrice(price),
      mDateTime(dateTime),
      mBarIndex(barIndex),
      mPnl(pnl),
      mBalance(balance)
  {}

  LedgerEntry LedgerEntry::createEntry (double price, const ptime& dateTime, std::size_t barIndex)
  {
    return LedgerEntry (TradeAction::ENTRY, price, dateTime, barIndex, std::nullopt, std::nullopt);
  }

  LedgerEntry LedgerEntry::createExit (double price,
				       const ptime& dateTime,
				       std::size_t barIndex,
				       double pnl,
				       double balance)
  {
    return LedgerEntry (TradeAction::EXIT, price, dateTime, barIndex, pnl, balance);
  }

  bool LedgerEntry::operator== (const LedgerEntry& rhs) const
  {
    return (mAction == rhs.mAction) &&
      (mPrice == rhs.mPrice) &&
      (mDateTime == rhs.mDateTime) &&
      (mBarIndex == rhs.mBarIndex) &&
      (mPnl == rhs.mPnl) &&
      (mBalance == rhs.mBalance);
  }

  bool LedgerEntry::operator!= (const LedgerEntry& rhs) const
  {
    return !(*this == rhs);
  }

  SimulationResult::SimulationResult (std::vector<LedgerEntry> ledger,
				      std::vector<double> equityCurve,
				      double initialBalance,
				      double finalBalance,
				      double maxDrawdown)
    : mLedger(std::move(ledger)),
      mEquityCurve(std::move(equityCurve)),
      mInitialBalance(initialBalance),
      mFinalBalance(finalBalance),
      mMaxDrawdown(maxDrawdown)
  {}

  std::size_t SimulationResult::getNumTrades() const
  {
    return static_cast<std::size_t>(std::count_if (mLedger.begin(), mLedger.end(),
						   [](const LedgerEntry& e) { return e.isExit(); }));
  }

  std::vector<double> SimulationResult::getClosedTradePnls() const
  {
    std::vector<double> pnls;
    for (const auto& entry : mLedger)
      {
	if (entry.isExit() && entry.getPnl())
	  pnls.push_back (*entry.getPnl());
      }

    return pnls;
  }

  bool SimulationResult::isPositionOpen() const
  {
    return !mLedger.empty() && mLedger.back().isEntry();
  }

  TradeSimulator::TradeSimulator (const ExecutionParameters& params)
    : mParameters(params),
      mObservers()
  {}

  void TradeSimulator::addObserver (std::shared_ptr<SimulationObserver> observer)
  {
    mObservers.push_back (observer);
  }

  double TradeSimulator::getExecutionPrice (const PriceSeries& series, std::size_t barIndex) const
  {
    if (mParameters.getOrderType() == OrderType::LIMIT && (barIndex + 1) < series.getNumBars())
      return series.getBar (barIndex + 1).getOpenValue();

    return series.getBar (barIndex).getCloseValue();
  }

  void TradeSimulator::notifyPositionOpened (const LedgerEntry& entry) const
  {
    for (const auto& observer : mObservers)
      observer->PositionOpened (entry);
  }

  void TradeSimulator::notifyPositionClosed (const LedgerEntry& exit) const
  {
    for (const auto& observer : mObservers)
      observer->PositionClosed (exit);
  }

  SimulationResult TradeSimulator::run (const PriceSeries& series,
					const std::vector<bool>& entrySignal,
					const std::vector<bool>& exitSignal) const
  {
    const std::size_t numBars = series.getNumBars();

    if (entrySignal.size() != numBars)
      throw SignalAlignmentError ("TradeSimulator::run - entry signal has " +
				  std::to_string (entrySignal.size()) + " values but the series has " +
				  std::to_string (numBars) + " bars");

    if (exitSignal.size() != numBars)
      throw SignalAlignmentError ("TradeSimulator::run - exit signal has " +
				  std::to_string (exitSignal.size()) + " values but the series has " +
				  std::to_string (numBars) + " bars");

    const double initialBalance = mParameters.getInitialBalance();
    const double positionSize = mParameters.getPositionSize();

    std::vector<LedgerEntry> ledger;
    std::vector<double> equityCurve;
    equityCurve.reserve (numBars);

    PositionState state = PositionState::FLAT;
    double entryPrice = 0.0;
    double balance = initialBalance;
    double peakBalance = initialBalance;
    double maxDrawdown = 0.0;

    for (std::size_t i = 0; i < numBars; ++i)
      {
	const PriceBar& bar = series.getBar (i);

	if (state == PositionState::FLAT)
	  {
	    if (entrySignal[i])
	      {
		entryPrice = getExecutionPrice (series, i);
		ledger.push_back (LedgerEntry::createEntry (entryPrice, bar.getDateTime(), i));
		state = PositionState::LONG;
		notifyPositionOpened (ledger.back());
	      }
	  }
	else if (exitSignal[i])
	  {
	    const double exitPrice = getExecutionPrice (series, i);
	    const double pnl = (exitPrice - entryPrice) * positionSize;
	    balance += pnl;

	    ledger.push_back (LedgerEntry::createExit (exitPrice, bar.getDateTime(), i, pnl, balance));
	    state = PositionState::FLAT;
	    notifyPositionClosed (ledger.back());
	  }

	equityCurve.push_back (balance);
	peakBalance = std::max (peakBalance, balance);
	maxDrawdown = std::max (maxDrawdown, peakBalance - balance);
      }

    return SimulationResult (std::move (ledger), std::move (equityCurve),
			     initialBalance, balance, maxDrawdown);
  }
} // namespace alphaflow
