/**
 * @file ExpressionParseDriver.cpp
 * @brief Implements the ExpressionParseDriver class.
 */

#include "ExpressionParseDriver.h"
#include "ExpressionException.h"

namespace alphaflow_expr
{

ExpressionParseDriver::ExpressionParseDriver (const std::string &text)
  : mText(text),
    mScanner(mText),
    mParser(mScanner, *this),
    mCondition(),
    mLogic(),
    mErrorMessage(),
    mErrorPosition(0)
{}

ComparisonExprPtr ExpressionParseDriver::parseCondition()
{
  runParser (ExpressionScanner::StartMode::CONDITION);
  return mCondition;
}

LogicExpressionPtr ExpressionParseDriver::parseLogic()
{
  runParser (ExpressionScanner::StartMode::LOGIC);
  return mLogic;
}

void ExpressionParseDriver::runParser (ExpressionScanner::StartMode mode)
{
  mCondition.reset();
  mLogic.reset();
  mErrorMessage.clear();
  mErrorPosition = 0;

  mScanner.reset (mode);
  int res = mParser.parse();

  // Bison convention: 0=success, 1=syntax error, 2=memory exhaustion
  if (res != 0)
    {
      if (mErrorMessage.empty())
	mErrorMessage = "parser failed with status " + std::to_string (res);

      throw alphaflow::ExpressionSyntaxError (mText, mErrorMessage, mErrorPosition);
    }
}

void ExpressionParseDriver::setCondition (ComparisonExprPtr condition)
{
  mCondition = condition;
}

void ExpressionParseDriver::setLogic (LogicExpressionPtr logic)
{
  mLogic = logic;
}

void ExpressionParseDriver::reportSyntaxError (const std::string &message, std::size_t position)
{
  // Keep the first error; later ones are consequences of it
  if (mErrorMessage.empty())
    {
      mErrorMessage = message;
      mErrorPosition = position;
    }
}

} // namespace alphaflow_expr
