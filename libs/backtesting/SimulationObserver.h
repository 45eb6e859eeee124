// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SIMULATION_OBSERVER_H
#define __SIMULATION_OBSERVER_H 1

namespace alphaflow
{
  class LedgerEntry;

  /**
   * @class SimulationObserver
   * @brief Interface for observing the position transitions of a TradeSimulator.
   *
   * Collaboration:
   * - TradeSimulator notifies every registered observer right after a ledger
   *   record has been appended.
   * - TradeLogObserver writes the transitions to a stream.
   */
  class SimulationObserver
  {
  public:
    SimulationObserver()
    {}

    virtual ~SimulationObserver()
    {}

    virtual void PositionOpened (const LedgerEntry& entry) = 0;
    virtual void PositionClosed (const LedgerEntry& exit) = 0;
  };
} // namespace alphaflow

#endif
