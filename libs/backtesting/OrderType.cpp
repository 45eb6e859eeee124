// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

#include "OrderType.h"
#include <stdexcept>
#include <boost/algorithm/string.hpp>

namespace alphaflow
{
  std::string orderTypeToString(OrderType orderType)
  {
    switch (orderType) {
      case OrderType::MARKET:
        return "market";
      case OrderType::LIMIT:
        return "limit";
    }

    return "unknown";
  }

  OrderType orderTypeFromString(const std::string& name)
  {
    std::string normalized = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (normalized == "market")
      return OrderType::MARKET;
    if (normalized == "limit")
      return OrderType::LIMIT;

    throw std::invalid_argument("Invalid order type '" + name + "', expected market or limit");
  }
}
