// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExecutionParameters.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace alphaflow
{
  namespace
  {
    void requireFinite (double value, const char *name)
    {
      if (!std::isfinite (value))
	throw std::domain_error (std::string ("ExecutionParameters: ") + name + " must be a finite number");
    }
  }

  ExecutionParameters::ExecutionParameters()
    : ExecutionParameters (OrderType::MARKET, DefaultInitialBalance, DefaultPositionSize)
  {}

  ExecutionParameters::ExecutionParameters (OrderType orderType,
					    double initialBalance,
					    double positionSize,
					    double periodsPerYear,
					    double riskFreeRate)
    : mOrderType(orderType),
      mInitialBalance(initialBalance),
      mPositionSize(positionSize),
      mPeriodsPerYear(periodsPerYear),
      mRiskFreeRate(riskFreeRate),
      mStopLoss(),
      mTakeProfit()
  {
    requireFinite (initialBalance, "initial_balance");
    requireFinite (positionSize, "position_size");
    requireFinite (riskFreeRate, "risk_free_rate");

    if (!std::isfinite (periodsPerYear) || periodsPerYear <= 0.0)
      throw std::domain_error ("ExecutionParameters: periods_per_year must be positive");
  }

  void ExecutionParameters::setStopLoss (double stopLoss)
  {
    requireFinite (stopLoss, "stop_loss");
    mStopLoss = stopLoss;
  }

  void ExecutionParameters::setTakeProfit (double takeProfit)
  {
    requireFinite (takeProfit, "take_profit");
    mTakeProfit = takeProfit;
  }
} // namespace alphaflow
