// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CONDITION_EVALUATOR_H
#define __CONDITION_EVALUATOR_H 1

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "ExpressionAst.h"
#include "ExpressionException.h"
#include "PriceSeries.h"

namespace alphaflow
{
  /**
   * @brief Named boolean sequences, one value per bar, keyed by condition name.
   */
  typedef std::map<std::string, std::vector<bool>> ConditionSequenceMap;

  /**
   * @brief Compiles a condition AST into lambdas bound to the columns of one series.
   *
   * Compilation resolves every column reference up front, so an unknown column
   * is reported before any bar is evaluated. The compiled evaluators hold
   * pointers into the series and must not outlive it.
   */
  class ConditionInterpreter
  {
  public:
    using ValueEvaluator = std::function<double(std::size_t barIndex)>;
    using ConditionPredicate = std::function<bool(std::size_t barIndex)>;

    /**
     * @throws UnknownColumnError if the expression references a missing column.
     */
    static ConditionPredicate compileCondition (alphaflow_expr::ComparisonExpr* expr,
						const PriceSeries& series);

  private:
    static ValueEvaluator compileValue (alphaflow_expr::ValueExpression* expr,
					const PriceSeries& series);
  };

  /**
   * @brief Evaluate a comparison expression at every bar of series.
   *
   * Arithmetic follows IEEE-754; a comparison involving NaN is false except
   * for '!=' which is true.
   *
   * @return one value per bar (empty for an empty series).
   * @throws ExpressionSyntaxError if expression does not match the condition grammar.
   * @throws UnknownColumnError if expression names a column series does not have.
   */
  std::vector<bool> evaluateCondition (const PriceSeries& series, const std::string& expression);

  /**
   * @brief Evaluate a list of conditions and name them COND1, COND2, ... in order.
   */
  ConditionSequenceMap evaluateConditions (const PriceSeries& series,
					   const std::vector<std::string>& expressions);

  std::string conditionName (std::size_t conditionIndex);
} // namespace alphaflow

#endif
