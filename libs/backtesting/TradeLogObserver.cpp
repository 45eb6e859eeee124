// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TradeLogObserver.h"
#include <iomanip>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TradeSimulator.h"

namespace alphaflow
{
  TradeLogObserver::TradeLogObserver (std::ostream& stream)
    : SimulationObserver(),
      mStream(stream)
  {}

  void TradeLogObserver::PositionOpened (const LedgerEntry& entry)
  {
    mStream << "ENTRY  bar " << std::setw(6) << entry.getBarIndex() << "  "
	    << boost::posix_time::to_simple_string (entry.getDateTime())
	    << "  price " << entry.getPrice() << std::endl;
  }

  void TradeLogObserver::PositionClosed (const LedgerEntry& exit)
  {
    mStream << "EXIT   bar " << std::setw(6) << exit.getBarIndex() << "  "
	    << boost::posix_time::to_simple_string (exit.getDateTime())
	    << "  price " << exit.getPrice()
	    << "  pnl " << exit.getPnl().value_or (0.0)
	    << "  balance " << exit.getBalance().value_or (0.0) << std::endl;
  }

  void writePerformanceTable (std::ostream& stream, const PerformanceSummary& summary)
  {
    const std::ios::fmtflags flags (stream.flags());
    const std::streamsize precision (stream.precision());

    stream << "\nPerformance summary\n";
    stream << "-------------------\n";
    stream << std::fixed << std::setprecision(4) << std::left;
    stream << std::setw(22) << "Total trades" << summary.getTotalTrades() << "\n";
    stream << std::setw(22) << "Total pnl" << summary.getTotalPnl() << "\n";
    stream << std::setw(22) << "Win rate (%)" << summary.getWinRate() << "\n";
    stream << std::setw(22) << "Max drawdown" << summary.getMaxDrawdown() << "\n";
    stream << std::setw(22) << "Max drawdown (%)" << summary.getMaxDrawdownPercent() << "\n";
    stream << std::setw(22) << "CAGR (%)" << summary.getCagr() << "\n";
    stream << std::setw(22) << "Sharpe" << summary.getSharpeRatio() << "\n";
    stream << std::setw(22) << "Sortino" << summary.getSortinoRatio() << "\n";
    stream << std::setw(22) << "Calmar" << summary.getCalmarRatio() << "\n";
    stream << std::setw(22) << "Volatility (%)" << summary.getVolatility() << "\n";
    stream << std::setw(22) << "VaR 95 (%)" << summary.getValueAtRisk95() << "\n";
    if (summary.getBeta())
      stream << std::setw(22) << "Beta" << *summary.getBeta() << "\n";
    stream << std::setw(22) << "Final balance" << summary.getFinalBalance() << std::endl;

    stream.flags (flags);
    stream.precision (precision);
  }
} // namespace alphaflow
