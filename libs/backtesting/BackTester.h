// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTESTER_H
#define __BACKTESTER_H 1

#include <list>
#include <memory>
#include <optional>
#include <vector>
#include "BacktestRequest.h"
#include "ExecutionParameters.h"
#include "PerformanceMetrics.h"
#include "PriceSeries.h"
#include "SimulationObserver.h"
#include "TradeSimulator.h"

namespace alphaflow
{
  /**
   * @class BacktestResult
   * @brief Simulation output together with its performance summary.
   */
  class BacktestResult
  {
  public:
    BacktestResult (const SimulationResult& simulation, const PerformanceSummary& summary)
      : mSimulation(simulation),
	mSummary(summary)
    {}

    const SimulationResult& getSimulationResult() const
    {
      return mSimulation;
    }

    const PerformanceSummary& getPerformanceSummary() const
    {
      return mSummary;
    }

  private:
    SimulationResult mSimulation;
    PerformanceSummary mSummary;
  };

  /**
   * @brief Run the trade simulator on precomputed signals and summarize the result.
   *
   * @param benchmarkReturns optional benchmark bar returns; beta is only reported when given.
   * @throws SignalAlignmentError if a signal does not have one value per bar.
   */
  BacktestResult simulate (const PriceSeries& series,
			   const std::vector<bool>& entrySignal,
			   const std::vector<bool>& exitSignal,
			   const ExecutionParameters& params,
			   const std::vector<double>* benchmarkReturns = nullptr);

  /**
   * @class BackTester
   * @brief Runs the full pipeline for one request against one price series.
   *
   * Pipeline: indicator columns, then every condition (named COND1..n), then
   * the entry and exit logic, then the simulation and its metrics. The series
   * given to the constructor is copied; indicator columns are only added to
   * the copy. Any validation error propagates before the simulation starts.
   *
   * Not thread-safe; use one BackTester per thread.
   */
  class BackTester
  {
  public:
    BackTester (const PriceSeries& series, const BacktestRequest& request);

    void addObserver (std::shared_ptr<SimulationObserver> observer);

    void setBenchmarkReturns (const std::vector<double>& benchmarkReturns);

    /**
     * @throws IndicatorException, ExpressionException, SignalAlignmentError
     */
    BacktestResult backtest() const;

    const BacktestRequest& getRequest() const
    {
      return mRequest;
    }

  private:
    PriceSeries mSeries;
    BacktestRequest mRequest;
    std::optional<std::vector<double>> mBenchmarkReturns;
    std::list<std::shared_ptr<SimulationObserver>> mObservers;
  };
} // namespace alphaflow

#endif
