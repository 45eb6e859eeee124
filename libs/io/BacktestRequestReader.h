// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_REQUEST_READER_H
#define __BACKTEST_REQUEST_READER_H 1

#include <string>
#include "BacktestRequest.h"
#include "TimeSeriesException.h"

namespace alphaflow
{
  class BacktestRequestException : public AlphaFlowException
  {
  public:
    explicit BacktestRequestException(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

  /**
   * @brief Builds a BacktestRequest from its JSON document.
   *
   * @code
   * {
   *   "indicators": [{"name": "ema", "params": {"period": 20, "out_col": "ema_20"}}],
   *   "logic": {"conditions": ["ema_20 > close"], "entry": "COND1", "exit": "NOT COND1"},
   *   "execution": {"order_type": "market", "initial_balance": 10000, "position_size": 1,
   *                 "stop_loss": 2.0, "take_profit": 5.0}
   * }
   * @endcode
   *
   * "logic" with its three members is required. "indicators", "execution" and
   * every execution member are optional. Indicator parameters may be given
   * as numbers or strings.
   */
  class BacktestRequestReader
  {
  public:
    /**
     * @throws BacktestRequestException if the document is malformed.
     * @throws std::domain_error if an execution value is out of range.
     */
    static BacktestRequest parseJson (const std::string& jsonText);

    /**
     * @throws BacktestRequestException if the file cannot be read or is malformed.
     */
    static BacktestRequest readFile (const std::string& fileName);
  };
} // namespace alphaflow

#endif
