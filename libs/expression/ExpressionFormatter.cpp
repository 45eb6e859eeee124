#include "ExpressionFormatter.h"

namespace alphaflow_expr
{

ExpressionFormatter::ExpressionFormatter()
  : ExpressionVisitor(),
    mOutput()
{}

ExpressionFormatter::~ExpressionFormatter()
{}

std::string ExpressionFormatter::format (ComparisonExpr *expr)
{
  ExpressionFormatter formatter;
  expr->accept (formatter);
  return formatter.getText();
}

std::string ExpressionFormatter::format (LogicExpression *expr)
{
  ExpressionFormatter formatter;
  expr->accept (formatter);
  return formatter.getText();
}

void ExpressionFormatter::visit (NumericLiteral *literal)
{
  mOutput << literal->getValue();
}

void ExpressionFormatter::visit (ColumnReference *column)
{
  mOutput << column->getName();
}

void ExpressionFormatter::visit (NegateExpr *negate)
{
  mOutput << "-";
  negate->getOperand()->accept (*this);
}

void ExpressionFormatter::visit (ArithmeticExpr *arith)
{
  mOutput << "(";
  arith->getLHS()->accept (*this);
  mOutput << " " << arithmeticOperatorToString (arith->getOperator()) << " ";
  arith->getRHS()->accept (*this);
  mOutput << ")";
}

void ExpressionFormatter::visit (ComparisonExpr *comparison)
{
  comparison->getLHS()->accept (*this);
  mOutput << " " << comparisonOperatorToString (comparison->getOperator()) << " ";
  comparison->getRHS()->accept (*this);
}

void ExpressionFormatter::visit (ConditionReference *condition)
{
  mOutput << condition->getName();
}

void ExpressionFormatter::visit (AndExpr *andExpr)
{
  mOutput << "(";
  andExpr->getLHS()->accept (*this);
  mOutput << " AND ";
  andExpr->getRHS()->accept (*this);
  mOutput << ")";
}

void ExpressionFormatter::visit (OrExpr *orExpr)
{
  mOutput << "(";
  orExpr->getLHS()->accept (*this);
  mOutput << " OR ";
  orExpr->getRHS()->accept (*this);
  mOutput << ")";
}

void ExpressionFormatter::visit (NotExpr *notExpr)
{
  mOutput << "NOT ";
  notExpr->getOperand()->accept (*this);
}

} // namespace alphaflow_expr
