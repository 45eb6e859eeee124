// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __LOGIC_COMBINATOR_H
#define __LOGIC_COMBINATOR_H 1

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "ConditionEvaluator.h"
#include "ExpressionAst.h"
#include "PriceSeries.h"

namespace alphaflow
{
  /**
   * @brief Compiles a logic AST into a per-bar predicate over named condition sequences.
   *
   * Condition names are matched case insensitively: both the names in the
   * expression and the keys of the mapping are compared in upper case.
   */
  class LogicInterpreter
  {
  public:
    using LogicPredicate = std::function<bool(std::size_t barIndex)>;

    /**
     * @throws UnknownConditionError if the expression names a condition that is not in conditions.
     */
    static LogicPredicate compileLogic (alphaflow_expr::LogicExpression* expr,
					const ConditionSequenceMap& conditions);
  };

  /**
   * @brief Combine named condition sequences with AND, OR and NOT at every bar.
   *
   * @param series     the series every condition sequence must align with.
   * @param conditions named per-bar condition results.
   * @param logic      e.g. "COND1 AND (COND2 OR NOT COND3)".
   * @return one value per bar.
   * @throws ExpressionSyntaxError if logic does not match the logic grammar.
   * @throws UnknownConditionError if logic names a missing condition.
   * @throws SignalAlignmentError if a sequence length differs from the series length.
   */
  std::vector<bool> evaluateLogic (const PriceSeries& series,
				   const ConditionSequenceMap& conditions,
				   const std::string& logic);
} // namespace alphaflow

#endif
