// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace alphaflow
{
  // Root of every error raised by the AlphaFlow libraries
  class AlphaFlowException : public std::runtime_error
  {
  public:
    explicit AlphaFlowException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~AlphaFlowException() = default;
  };

  class PriceSeriesException : public AlphaFlowException
  {
  public:
    explicit PriceSeriesException(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

  /**
   * @brief Raised when a per-bar sequence does not line up with the price series
   *        it is supposed to describe (entry/exit signals, condition results).
   */
  class SignalAlignmentError : public AlphaFlowException
  {
  public:
    explicit SignalAlignmentError(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

} // namespace alphaflow

#endif // __TIMESERIES_EXCEPTION_H
