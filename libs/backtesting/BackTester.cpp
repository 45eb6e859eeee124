// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BackTester.h"
#include "ConditionEvaluator.h"
#include "LogicCombinator.h"
#include "TimeSeriesIndicators.h"

namespace alphaflow
{
  namespace
  {
    BacktestResult summarizeRun (const SimulationResult& simulation,
				 const ExecutionParameters& params,
				 const std::vector<double>* benchmarkReturns)
    {
      PerformanceSummary summary =
	PerformanceMetrics::summarize (simulation.getEquityCurve(),
				       simulation.getClosedTradePnls(),
				       simulation.getInitialBalance(),
				       simulation.getFinalBalance(),
				       simulation.getMaxDrawdown(),
				       params.getPeriodsPerYear(),
				       params.getRiskFreeRate(),
				       benchmarkReturns);

      return BacktestResult (simulation, summary);
    }
  }

  BacktestResult simulate (const PriceSeries& series,
			   const std::vector<bool>& entrySignal,
			   const std::vector<bool>& exitSignal,
			   const ExecutionParameters& params,
			   const std::vector<double>* benchmarkReturns)
  {
    TradeSimulator simulator (params);
    return summarizeRun (simulator.run (series, entrySignal, exitSignal), params, benchmarkReturns);
  }

  BackTester::BackTester (const PriceSeries& series, const BacktestRequest& request)
    : mSeries(series),
      mRequest(request),
      mBenchmarkReturns(),
      mObservers()
  {}

  void BackTester::addObserver (std::shared_ptr<SimulationObserver> observer)
  {
    mObservers.push_back (observer);
  }

  void BackTester::setBenchmarkReturns (const std::vector<double>& benchmarkReturns)
  {
    mBenchmarkReturns = benchmarkReturns;
  }

  BacktestResult BackTester::backtest() const
  {
    PriceSeries augmented (IndicatorColumnProvider::applyIndicators (mSeries, mRequest.getIndicators()));

    ConditionSequenceMap conditions (evaluateConditions (augmented, mRequest.getConditions()));
    std::vector<bool> entrySignal (evaluateLogic (augmented, conditions, mRequest.getEntryLogic()));
    std::vector<bool> exitSignal (evaluateLogic (augmented, conditions, mRequest.getExitLogic()));

    TradeSimulator simulator (mRequest.getExecutionParameters());
    for (const auto& observer : mObservers)
      simulator.addObserver (observer);

    SimulationResult simulation (simulator.run (augmented, entrySignal, exitSignal));

    return summarizeRun (simulation,
			 mRequest.getExecutionParameters(),
			 mBenchmarkReturns ? &(*mBenchmarkReturns) : nullptr);
  }
} // namespace alphaflow
