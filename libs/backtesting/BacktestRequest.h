// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_REQUEST_H
#define __BACKTEST_REQUEST_H 1

#include <string>
#include <vector>
#include "ExecutionParameters.h"
#include "TimeSeriesIndicators.h"

namespace alphaflow
{
  /**
   * @class BacktestRequest
   * @brief Everything needed to backtest one strategy except the price data.
   *
   * Conditions are referenced from the entry and exit logic as COND1, COND2,
   * ... in the order they are listed.
   */
  class BacktestRequest
  {
  public:
    BacktestRequest (const std::vector<IndicatorSpec>& indicators,
		     const std::vector<std::string>& conditions,
		     const std::string& entryLogic,
		     const std::string& exitLogic,
		     const ExecutionParameters& executionParameters)
      : mIndicators(indicators),
	mConditions(conditions),
	mEntryLogic(entryLogic),
	mExitLogic(exitLogic),
	mExecutionParameters(executionParameters)
    {}

    const std::vector<IndicatorSpec>& getIndicators() const
    {
      return mIndicators;
    }

    const std::vector<std::string>& getConditions() const
    {
      return mConditions;
    }

    const std::string& getEntryLogic() const
    {
      return mEntryLogic;
    }

    const std::string& getExitLogic() const
    {
      return mExitLogic;
    }

    const ExecutionParameters& getExecutionParameters() const
    {
      return mExecutionParameters;
    }

  private:
    std::vector<IndicatorSpec> mIndicators;
    std::vector<std::string> mConditions;
    std::string mEntryLogic;
    std::string mExitLogic;
    ExecutionParameters mExecutionParameters;
  };
} // namespace alphaflow

#endif
