// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TRADE_LOG_OBSERVER_H
#define __TRADE_LOG_OBSERVER_H 1

#include <ostream>
#include "PerformanceMetrics.h"
#include "SimulationObserver.h"

namespace alphaflow
{
  /**
   * @class TradeLogObserver
   * @brief Writes one line per ENTRY and EXIT to a stream as the simulation runs.
   *
   * The stream must outlive the observer. The command line tool passes
   * std::cerr so that a JSON result on stdout stays parseable.
   */
  class TradeLogObserver : public SimulationObserver
  {
  public:
    explicit TradeLogObserver (std::ostream& stream);

    void PositionOpened (const LedgerEntry& entry);
    void PositionClosed (const LedgerEntry& exit);

  private:
    std::ostream& mStream;
  };

  /// Two column table of every summary field; beta only when present
  void writePerformanceTable (std::ostream& stream, const PerformanceSummary& summary);
} // namespace alphaflow

#endif
