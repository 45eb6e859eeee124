// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ConditionEvaluator.h"
#include "ExpressionParseDriver.h"

namespace alphaflow
{
  using namespace alphaflow_expr;

  ConditionInterpreter::ConditionPredicate
  ConditionInterpreter::compileCondition (ComparisonExpr* expr, const PriceSeries& series)
  {
    auto L = compileValue (expr->getLHS(), series);
    auto R = compileValue (expr->getRHS(), series);

    switch (expr->getOperator())
      {
      case ComparisonOperator::LESS_THAN:
	return [L,R](std::size_t i) -> bool { return L(i) < R(i); };
      case ComparisonOperator::GREATER_THAN:
	return [L,R](std::size_t i) -> bool { return L(i) > R(i); };
      case ComparisonOperator::LESS_EQUAL:
	return [L,R](std::size_t i) -> bool { return L(i) <= R(i); };
      case ComparisonOperator::GREATER_EQUAL:
	return [L,R](std::size_t i) -> bool { return L(i) >= R(i); };
      case ComparisonOperator::EQUAL:
	return [L,R](std::size_t i) -> bool { return L(i) == R(i); };
      case ComparisonOperator::NOT_EQUAL:
	return [L,R](std::size_t i) -> bool { return L(i) != R(i); };
      }

    throw ExpressionException ("compileCondition: unsupported comparison operator");
  }

  ConditionInterpreter::ValueEvaluator
  ConditionInterpreter::compileValue (ValueExpression* expr, const PriceSeries& series)
  {
    if (auto pLiteral = dynamic_cast<NumericLiteral*>(expr))
      {
	double value = pLiteral->getValue();
	return [value](std::size_t) -> double { return value; };
      }
    else if (auto pColumn = dynamic_cast<ColumnReference*>(expr))
      {
	const std::vector<double>* column = series.findColumn (pColumn->getName());
	if (column == nullptr)
	  throw UnknownColumnError (pColumn->getName());

	return [column](std::size_t i) -> double { return (*column)[i]; };
      }
    else if (auto pNegate = dynamic_cast<NegateExpr*>(expr))
      {
	auto operand = compileValue (pNegate->getOperand(), series);
	return [operand](std::size_t i) -> double { return -operand(i); };
      }
    else if (auto pArith = dynamic_cast<ArithmeticExpr*>(expr))
      {
	auto L = compileValue (pArith->getLHS(), series);
	auto R = compileValue (pArith->getRHS(), series);

	switch (pArith->getOperator())
	  {
	  case ArithmeticOperator::ADD:
	    return [L,R](std::size_t i) -> double { return L(i) + R(i); };
	  case ArithmeticOperator::SUBTRACT:
	    return [L,R](std::size_t i) -> double { return L(i) - R(i); };
	  case ArithmeticOperator::MULTIPLY:
	    return [L,R](std::size_t i) -> double { return L(i) * R(i); };
	  case ArithmeticOperator::DIVIDE:
	    return [L,R](std::size_t i) -> double { return L(i) / R(i); };
	  }
      }

    throw ExpressionException ("compileValue: unsupported ValueExpression type");
  }

  std::vector<bool> evaluateCondition (const PriceSeries& series, const std::string& expression)
  {
    ExpressionParseDriver driver (expression);
    ComparisonExprPtr condition = driver.parseCondition();

    auto predicate = ConditionInterpreter::compileCondition (condition.get(), series);

    std::vector<bool> result;
    result.reserve (series.getNumBars());

    for (std::size_t i = 0; i < series.getNumBars(); ++i)
      result.push_back (predicate (i));

    return result;
  }

  std::string conditionName (std::size_t conditionIndex)
  {
    return "COND" + std::to_string (conditionIndex + 1);
  }

  ConditionSequenceMap evaluateConditions (const PriceSeries& series,
					   const std::vector<std::string>& expressions)
  {
    ConditionSequenceMap conditions;

    for (std::size_t i = 0; i < expressions.size(); ++i)
      conditions[conditionName (i)] = evaluateCondition (series, expressions[i]);

    return conditions;
  }
} // namespace alphaflow
