// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXPRESSION_EXCEPTION_H
#define __EXPRESSION_EXCEPTION_H 1

#include <cstddef>
#include <string>
#include "TimeSeriesException.h"

namespace alphaflow
{
  class ExpressionException : public AlphaFlowException
  {
  public:
    explicit ExpressionException(const std::string& msg)
      : AlphaFlowException(msg)
    {}
  };

  /**
   * @brief A condition or logic string that does not match its grammar.
   *
   * The zero based character offset of the offending token is kept so a
   * caller can point at it.
   */
  class ExpressionSyntaxError : public ExpressionException
  {
  public:
    ExpressionSyntaxError(const std::string& expression,
			  const std::string& detail,
			  std::size_t position)
      : ExpressionException("Syntax error in expression '" + expression + "' at position " +
			    std::to_string(position) + ": " + detail),
	mExpression(expression),
	mPosition(position)
    {}

    const std::string& getExpression() const
    {
      return mExpression;
    }

    std::size_t getPosition() const
    {
      return mPosition;
    }

  private:
    std::string mExpression;
    std::size_t mPosition;
  };

  class UnknownColumnError : public ExpressionException
  {
  public:
    explicit UnknownColumnError(const std::string& columnName)
      : ExpressionException("Unknown column '" + columnName + "'"),
	mName(columnName)
    {}

    const std::string& getName() const
    {
      return mName;
    }

  private:
    std::string mName;
  };

  class UnknownConditionError : public ExpressionException
  {
  public:
    explicit UnknownConditionError(const std::string& conditionName)
      : ExpressionException("Unknown condition '" + conditionName + "'"),
	mName(conditionName),
	mLogic()
    {}

    // logic is the parsed expression rendered with explicit grouping
    UnknownConditionError(const std::string& conditionName, const std::string& logic)
      : ExpressionException("Unknown condition '" + conditionName + "' in logic " + logic),
	mName(conditionName),
	mLogic(logic)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    const std::string& getLogic() const
    {
      return mLogic;
    }

  private:
    std::string mName;
    std::string mLogic;
  };
} // namespace alphaflow

#endif
