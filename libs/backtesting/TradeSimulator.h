// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TRADE_SIMULATOR_H
#define __TRADE_SIMULATOR_H 1

#include <cstddef>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ExecutionParameters.h"
#include "PriceSeries.h"
#include "SimulationObserver.h"

namespace alphaflow
{
  using boost::posix_time::ptime;

  enum class TradeAction { ENTRY, EXIT };

  /// "entry" or "exit"
  std::string tradeActionToString (TradeAction action);

  /**
   * @class LedgerEntry
   * @brief One realized position transition.
   *
   * Exit records additionally carry the realized pnl of the round trip and
   * the account balance after it.
   */
  class LedgerEntry
  {
  public:
    static LedgerEntry createEntry (double price, const ptime& dateTime, std::size_t barIndex);

    static LedgerEntry createExit (double price,
				   const ptime& dateTime,
				   std::size_t barIndex,
				   double pnl,
				   double balance);

    TradeAction getAction() const
    {
      return mAction;
    }

    bool isEntry() const
    {
      return mAction == TradeAction::ENTRY;
    }

    bool isExit() const
    {
      return mAction == TradeAction::EXIT;
    }

    double getPrice() const
    {
      return mPrice;
    }

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    std::size_t getBarIndex() const
    {
      return mBarIndex;
    }

    /// Present for exits only
    const std::optional<double>& getPnl() const
    {
      return mPnl;
    }

    /// Present for exits only
    const std::optional<double>& getBalance() const
    {
      return mBalance;
    }

    bool operator== (const LedgerEntry& rhs) const;
    bool operator!= (const LedgerEntry& rhs) const;

  private:
    LedgerEntry (TradeAction action,
		 double price,
		 const ptime& dateTime,
		 std::size_t barIndex,
		 const std::optional<double>& pnl,
		 const std::optional<double>& balance);

  private:
    TradeAction mAction;
    double mPrice;
    ptime mDateTime;
    std::size_t mBarIndex;
    std::optional<double> mPnl;
    std::optional<double> mBalance;
  };

  /**
   * @class SimulationResult
   * @brief Ledger, equity curve and account figures produced by one simulation.
   */
  class SimulationResult
  {
  public:
    typedef std::vector<LedgerEntry>::const_iterator ConstLedgerIterator;

    SimulationResult (std::vector<LedgerEntry> ledger,
		      std::vector<double> equityCurve,
		      double initialBalance,
		      double finalBalance,
		      double maxDrawdown);

    const std::vector<LedgerEntry>& getLedger() const
    {
      return mLedger;
    }

    ConstLedgerIterator beginLedger() const
    {
      return mLedger.begin();
    }

    ConstLedgerIterator endLedger() const
    {
      return mLedger.end();
    }

    /// Balance after every bar, one value per bar
    const std::vector<double>& getEquityCurve() const
    {
      return mEquityCurve;
    }

    double getInitialBalance() const
    {
      return mInitialBalance;
    }

    double getFinalBalance() const
    {
      return mFinalBalance;
    }

    /// finalBalance - initialBalance
    double getTotalPnl() const
    {
      return mFinalBalance - mInitialBalance;
    }

    /// Largest peak to trough decline of the balance in currency units
    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    /// Number of completed (exit) trades
    std::size_t getNumTrades() const;

    std::vector<double> getClosedTradePnls() const;

    /// True when the last ledger record is an unmatched entry
    bool isPositionOpen() const;

  private:
    std::vector<LedgerEntry> mLedger;
    std::vector<double> mEquityCurve;
    double mInitialBalance;
    double mFinalBalance;
    double mMaxDrawdown;
  };

  /**
   * @class TradeSimulator
   * @brief Single position, long only execution of per-bar entry and exit signals.
   *
   * The simulator walks the bars once in time order with two states:
   *
   * - FLAT: an entry signal opens a position at the execution price.
   * - LONG: an exit signal closes it; pnl = (exit - entry) * position size
   *   is added to the balance.
   *
   * The entry signal is only examined while flat and the exit signal only
   * while long, so at most one transition happens per bar and a position is
   * never opened and closed on the same bar. A position still open after the
   * last bar stays open and unrealized.
   */
  class TradeSimulator
  {
  public:
    explicit TradeSimulator (const ExecutionParameters& params);

    void addObserver (std::shared_ptr<SimulationObserver> observer);

    /**
     * @throws SignalAlignmentError if entry or exit does not have one value per bar.
     */
    SimulationResult run (const PriceSeries& series,
			  const std::vector<bool>& entrySignal,
			  const std::vector<bool>& exitSignal) const;

    const ExecutionParameters& getExecutionParameters() const
    {
      return mParameters;
    }

  private:
    enum class PositionState { FLAT, LONG };

    double getExecutionPrice (const PriceSeries& series, std::size_t barIndex) const;
    void notifyPositionOpened (const LedgerEntry& entry) const;
    void notifyPositionClosed (const LedgerEntry& exit) const;

  private:
    ExecutionParameters mParameters;
    std::list<std::shared_ptr<SimulationObserver>> mObservers;
  };
} // namespace alphaflow

#endif
