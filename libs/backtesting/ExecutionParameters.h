// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXECUTION_PARAMETERS_H
#define __EXECUTION_PARAMETERS_H 1

#include <optional>
#include "OrderType.h"

namespace alphaflow
{
  /**
   * @class ExecutionParameters
   * @brief Order timing, sizing and annualization settings of one simulation.
   *
   * Stop loss and take profit levels are carried so they can be reported
   * back with the results; the simulator does not act on them.
   */
  class ExecutionParameters
  {
  public:
    static constexpr double DefaultInitialBalance = 10000.0;
    static constexpr double DefaultPositionSize = 1.0;
    static constexpr double DefaultPeriodsPerYear = 252.0;

    /// Market orders, 10000 starting balance, one unit per trade
    ExecutionParameters();

    /**
     * @throws std::domain_error if initialBalance or positionSize is not finite,
     *         periodsPerYear is not positive or riskFreeRate is not finite.
     */
    ExecutionParameters (OrderType orderType,
			 double initialBalance,
			 double positionSize,
			 double periodsPerYear = DefaultPeriodsPerYear,
			 double riskFreeRate = 0.0);

    OrderType getOrderType() const
    {
      return mOrderType;
    }

    double getInitialBalance() const
    {
      return mInitialBalance;
    }

    double getPositionSize() const
    {
      return mPositionSize;
    }

    double getPeriodsPerYear() const
    {
      return mPeriodsPerYear;
    }

    double getRiskFreeRate() const
    {
      return mRiskFreeRate;
    }

    const std::optional<double>& getStopLoss() const
    {
      return mStopLoss;
    }

    const std::optional<double>& getTakeProfit() const
    {
      return mTakeProfit;
    }

    /**
     * @throws std::domain_error if stopLoss is not finite.
     */
    void setStopLoss (double stopLoss);

    /**
     * @throws std::domain_error if takeProfit is not finite.
     */
    void setTakeProfit (double takeProfit);

  private:
    OrderType mOrderType;
    double mInitialBalance;
    double mPositionSize;
    double mPeriodsPerYear;
    double mRiskFreeRate;
    std::optional<double> mStopLoss;
    std::optional<double> mTakeProfit;
  };
} // namespace alphaflow

#endif
