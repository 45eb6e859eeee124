// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_WRITER_H
#define __BACKTEST_RESULT_WRITER_H 1

#include <string>
#include "BackTester.h"
#include "ExecutionParameters.h"

namespace alphaflow
{
  /**
   * @brief Serializes a BacktestResult as a pretty printed JSON document with
   *        "trades", "metrics" and "execution" members.
   *
   * Non-finite numbers are written as null since JSON cannot represent them.
   */
  class BacktestResultWriter
  {
  public:
    static std::string toJson (const BacktestResult& result, const ExecutionParameters& params);

    /**
     * @throws std::runtime_error if the file cannot be written.
     */
    static void writeFile (const BacktestResult& result,
			   const ExecutionParameters& params,
			   const std::string& fileName);
  };
} // namespace alphaflow

#endif
