#include "ExpressionAst.h"

namespace alphaflow_expr
{

ValueExpression::ValueExpression()
{}

ValueExpression::~ValueExpression()
{}

NumericLiteral::NumericLiteral (double value)
  : ValueExpression(),
    mValue(value)
{}

NumericLiteral::~NumericLiteral()
{}

void NumericLiteral::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

ColumnReference::ColumnReference (const std::string& columnName)
  : ValueExpression(),
    mName(columnName)
{}

ColumnReference::~ColumnReference()
{}

void ColumnReference::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

NegateExpr::NegateExpr (ValueExpressionPtr operand)
  : ValueExpression(),
    mOperand(operand)
{}

NegateExpr::~NegateExpr()
{}

void NegateExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

std::string arithmeticOperatorToString (ArithmeticOperator op)
{
  switch (op)
    {
    case ArithmeticOperator::ADD:
      return "+";
    case ArithmeticOperator::SUBTRACT:
      return "-";
    case ArithmeticOperator::MULTIPLY:
      return "*";
    case ArithmeticOperator::DIVIDE:
      return "/";
    }

  return "?";
}

ArithmeticExpr::ArithmeticExpr (ArithmeticOperator op, ValueExpressionPtr lhs, ValueExpressionPtr rhs)
  : ValueExpression(),
    mOperator(op),
    mLeftHandSide(lhs),
    mRightHandSide(rhs)
{}

ArithmeticExpr::~ArithmeticExpr()
{}

void ArithmeticExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

std::string comparisonOperatorToString (ComparisonOperator op)
{
  switch (op)
    {
    case ComparisonOperator::LESS_THAN:
      return "<";
    case ComparisonOperator::GREATER_THAN:
      return ">";
    case ComparisonOperator::LESS_EQUAL:
      return "<=";
    case ComparisonOperator::GREATER_EQUAL:
      return ">=";
    case ComparisonOperator::EQUAL:
      return "==";
    case ComparisonOperator::NOT_EQUAL:
      return "!=";
    }

  return "?";
}

ComparisonExpr::ComparisonExpr (ComparisonOperator op, ValueExpressionPtr lhs, ValueExpressionPtr rhs)
  : mOperator(op),
    mLeftHandSide(lhs),
    mRightHandSide(rhs)
{}

ComparisonExpr::~ComparisonExpr()
{}

void ComparisonExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

LogicExpression::LogicExpression()
{}

LogicExpression::~LogicExpression()
{}

ConditionReference::ConditionReference (const std::string& conditionName)
  : LogicExpression(),
    mName(conditionName)
{}

ConditionReference::~ConditionReference()
{}

void ConditionReference::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

BinaryLogicExpr::BinaryLogicExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs)
  : LogicExpression(),
    mLeftHandSide(lhs),
    mRightHandSide(rhs)
{}

BinaryLogicExpr::~BinaryLogicExpr()
{}

AndExpr::AndExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs)
  : BinaryLogicExpr(lhs, rhs)
{}

AndExpr::~AndExpr()
{}

void AndExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

OrExpr::OrExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs)
  : BinaryLogicExpr(lhs, rhs)
{}

OrExpr::~OrExpr()
{}

void OrExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

NotExpr::NotExpr (LogicExpressionPtr operand)
  : LogicExpression(),
    mOperand(operand)
{}

NotExpr::~NotExpr()
{}

void NotExpr::accept (ExpressionVisitor &v)
{
  v.visit (this);
}

ExpressionVisitor::ExpressionVisitor()
{}

ExpressionVisitor::~ExpressionVisitor()
{}

} // namespace alphaflow_expr
