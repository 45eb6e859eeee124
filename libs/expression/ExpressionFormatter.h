#ifndef EXPRESSION_FORMATTER_H
#define EXPRESSION_FORMATTER_H

#include <sstream>
#include <string>
#include "ExpressionAst.h"

namespace alphaflow_expr
{

/**
 * @brief Renders a parsed condition or logic tree back to text.
 *
 * Every arithmetic and binary logic node is wrapped in parentheses so the
 * output shows exactly how the parser grouped the input, e.g.
 * "a + b * 2 > c" renders as "(a + (b * 2)) > c" and
 * "not A and B or C" as "((NOT A AND B) OR C)".
 */
class ExpressionFormatter : public ExpressionVisitor
{
public:
  ExpressionFormatter();
  ~ExpressionFormatter();

  static std::string format (ComparisonExpr *expr);
  static std::string format (LogicExpression *expr);

  void visit (NumericLiteral *);
  void visit (ColumnReference *);
  void visit (NegateExpr *);
  void visit (ArithmeticExpr *);
  void visit (ComparisonExpr *);
  void visit (ConditionReference *);
  void visit (AndExpr *);
  void visit (OrExpr *);
  void visit (NotExpr *);

  std::string getText() const
  {
    return mOutput.str();
  }

private:
  std::ostringstream mOutput;
};

} // namespace alphaflow_expr

#endif
