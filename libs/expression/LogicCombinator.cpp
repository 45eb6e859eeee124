// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "LogicCombinator.h"
#include <boost/algorithm/string/case_conv.hpp>
#include "ExpressionFormatter.h"
#include "ExpressionParseDriver.h"
#include "TimeSeriesException.h"

namespace alphaflow
{
  using namespace alphaflow_expr;

  namespace
  {
    const std::vector<bool>* findCondition (const ConditionSequenceMap& conditions,
					    const std::string& upperName)
    {
      for (const auto& entry : conditions)
	{
	  if (boost::algorithm::to_upper_copy (entry.first) == upperName)
	    return &(entry.second);
	}

      return nullptr;
    }
  }

  LogicInterpreter::LogicPredicate
  LogicInterpreter::compileLogic (LogicExpression* expr, const ConditionSequenceMap& conditions)
  {
    if (auto pRef = dynamic_cast<ConditionReference*>(expr))
      {
	std::string name (boost::algorithm::to_upper_copy (pRef->getName()));
	const std::vector<bool>* sequence = findCondition (conditions, name);
	if (sequence == nullptr)
	  throw UnknownConditionError (name);

	return [sequence](std::size_t i) -> bool { return (*sequence)[i]; };
      }
    else if (auto pAnd = dynamic_cast<AndExpr*>(expr))
      {
	auto L = compileLogic (pAnd->getLHS(), conditions);
	auto R = compileLogic (pAnd->getRHS(), conditions);
	return [L,R](std::size_t i) -> bool { return L(i) && R(i); };
      }
    else if (auto pOr = dynamic_cast<OrExpr*>(expr))
      {
	auto L = compileLogic (pOr->getLHS(), conditions);
	auto R = compileLogic (pOr->getRHS(), conditions);
	return [L,R](std::size_t i) -> bool { return L(i) || R(i); };
      }
    else if (auto pNot = dynamic_cast<NotExpr*>(expr))
      {
	auto operand = compileLogic (pNot->getOperand(), conditions);
	return [operand](std::size_t i) -> bool { return !operand(i); };
      }

    throw ExpressionException ("compileLogic: unsupported LogicExpression type");
  }

  std::vector<bool> evaluateLogic (const PriceSeries& series,
				   const ConditionSequenceMap& conditions,
				   const std::string& logic)
  {
    for (const auto& entry : conditions)
      {
	if (entry.second.size() != series.getNumBars())
	  throw SignalAlignmentError ("Condition " + entry.first + " has " +
				      std::to_string (entry.second.size()) +
				      " values but the price series has " +
				      std::to_string (series.getNumBars()) + " bars");
      }

    ExpressionParseDriver driver (logic);
    LogicExpressionPtr expr = driver.parseLogic();

    LogicInterpreter::LogicPredicate predicate;
    try
      {
	predicate = LogicInterpreter::compileLogic (expr.get(), conditions);
      }
    catch (const UnknownConditionError& e)
      {
	throw UnknownConditionError (e.getName(), ExpressionFormatter::format (expr.get()));
      }

    std::vector<bool> result;
    result.reserve (series.getNumBars());

    for (std::size_t i = 0; i < series.getNumBars(); ++i)
      result.push_back (predicate (i));

    return result;
  }
} // namespace alphaflow
