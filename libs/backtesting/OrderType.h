// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

/**
 * @file OrderType.h
 *
 * @brief Enumeration and utilities for the execution price rule of simulated orders
 *
 * ### Responsibilities:
 * - Define OrderType enum for the price selection rules the simulator supports
 * - Provide utility functions for string conversion and parsing
 *
 * ### Collaboration:
 * - Carried by ExecutionParameters and consulted by TradeSimulator on every fill
 * - Parsed from the "order_type" field of a backtest request
 */

#ifndef __ORDER_TYPE_H
#define __ORDER_TYPE_H 1

#include <string>

namespace alphaflow
{
  /**
   * @enum OrderType
   * @brief How the fill price of an entry or exit is chosen.
   *
   * Both rules fill on the bar whose signal triggered the order; LIMIT only
   * borrows the following bar's open as the price.
   */
  enum class OrderType {
    MARKET,     ///< Fill at the close of the signalling bar
    LIMIT       ///< Fill at the open of the next bar, or the signalling bar's close on the last bar
  };

  /**
   * @brief Converts OrderType enum to its request representation
   * @return "market" or "limit"
   */
  std::string orderTypeToString(OrderType orderType);

  /**
   * @brief Parses an order type name, ignoring case and surrounding blanks
   * @param name "market" or "limit"
   * @throws std::invalid_argument if name is not a known order type
   */
  OrderType orderTypeFromString(const std::string& name);
}

#endif
