/** @file ExpressionParseDriver.h
 *  @brief Declaration of the alphaflow_expr::ExpressionParseDriver class.
 */

#ifndef EXPRESSION_PARSE_DRIVER_H
#define EXPRESSION_PARSE_DRIVER_H

#include <cstddef>
#include <string>
#include "ExpressionAst.h"
#include "ExpressionScanner.h"
#include "ExpressionParser.hpp"

namespace alphaflow_expr
{

/**
 * @brief Connects the ExpressionScanner and the generated ExpressionParser for
 *        one expression string.
 *
 * The same text can be parsed as a condition or as a logic expression; each
 * call restarts the scanner. Parse failures are raised as
 * alphaflow::ExpressionSyntaxError carrying the offending position.
 */
class ExpressionParseDriver
{
public:
  explicit ExpressionParseDriver (const std::string &text);

  ExpressionParseDriver (const ExpressionParseDriver&) = delete;
  ExpressionParseDriver& operator= (const ExpressionParseDriver&) = delete;

  /**
   * @brief Parse the text as a single comparison.
   * @throws alphaflow::ExpressionSyntaxError if the text is not a valid condition.
   */
  ComparisonExprPtr parseCondition();

  /**
   * @brief Parse the text as an AND/OR/NOT combination of condition names.
   * @throws alphaflow::ExpressionSyntaxError if the text is not a valid logic expression.
   */
  LogicExpressionPtr parseLogic();

  const std::string& getText() const
  {
    return mText;
  }

private:
  void setCondition (ComparisonExprPtr condition);
  void setLogic (LogicExpressionPtr logic);
  void reportSyntaxError (const std::string &message, std::size_t position);
  void runParser (ExpressionScanner::StartMode mode);

  // The parser calls back into the driver from its semantic actions
  friend class ExpressionParser;

private:
  std::string mText;
  ExpressionScanner mScanner;
  ExpressionParser mParser;
  ComparisonExprPtr mCondition;
  LogicExpressionPtr mLogic;
  std::string mErrorMessage;
  std::size_t mErrorPosition;
};

} // namespace alphaflow_expr

#endif // EXPRESSION_PARSE_DRIVER_H
