#ifndef EXPRESSION_AST_H
#define EXPRESSION_AST_H

#include <memory>
#include <string>

namespace alphaflow_expr
{

class ExpressionVisitor;

/////////////////////
// Value expressions: evaluate to one number per bar

class ValueExpression
{
public:
  ValueExpression();
  virtual ~ValueExpression();
  virtual void accept (ExpressionVisitor &v) = 0;
};

typedef std::shared_ptr<ValueExpression> ValueExpressionPtr;

class NumericLiteral : public ValueExpression
{
public:
  explicit NumericLiteral (double value);
  ~NumericLiteral();
  void accept (ExpressionVisitor &v);

  double getValue() const
  {
    return mValue;
  }

private:
  double mValue;
};

class ColumnReference : public ValueExpression
{
public:
  explicit ColumnReference (const std::string& columnName);
  ~ColumnReference();
  void accept (ExpressionVisitor &v);

  const std::string& getName() const
  {
    return mName;
  }

private:
  std::string mName;
};

class NegateExpr : public ValueExpression
{
public:
  explicit NegateExpr (ValueExpressionPtr operand);
  ~NegateExpr();
  void accept (ExpressionVisitor &v);

  ValueExpression *getOperand() const
  {
    return mOperand.get();
  }

private:
  ValueExpressionPtr mOperand;
};

enum class ArithmeticOperator { ADD, SUBTRACT, MULTIPLY, DIVIDE };

std::string arithmeticOperatorToString (ArithmeticOperator op);

class ArithmeticExpr : public ValueExpression
{
public:
  ArithmeticExpr (ArithmeticOperator op, ValueExpressionPtr lhs, ValueExpressionPtr rhs);
  ~ArithmeticExpr();
  void accept (ExpressionVisitor &v);

  ArithmeticOperator getOperator() const
  {
    return mOperator;
  }

  ValueExpression *getLHS() const
  {
    return mLeftHandSide.get();
  }

  ValueExpression *getRHS() const
  {
    return mRightHandSide.get();
  }

private:
  ArithmeticOperator mOperator;
  ValueExpressionPtr mLeftHandSide;
  ValueExpressionPtr mRightHandSide;
};

/////////////////////
// Conditions: exactly one comparison of two value expressions

enum class ComparisonOperator { LESS_THAN, GREATER_THAN, LESS_EQUAL, GREATER_EQUAL, EQUAL, NOT_EQUAL };

std::string comparisonOperatorToString (ComparisonOperator op);

class ComparisonExpr
{
public:
  ComparisonExpr (ComparisonOperator op, ValueExpressionPtr lhs, ValueExpressionPtr rhs);
  ~ComparisonExpr();
  void accept (ExpressionVisitor &v);

  ComparisonOperator getOperator() const
  {
    return mOperator;
  }

  ValueExpression *getLHS() const
  {
    return mLeftHandSide.get();
  }

  ValueExpression *getRHS() const
  {
    return mRightHandSide.get();
  }

private:
  ComparisonOperator mOperator;
  ValueExpressionPtr mLeftHandSide;
  ValueExpressionPtr mRightHandSide;
};

typedef std::shared_ptr<ComparisonExpr> ComparisonExprPtr;

/////////////////////
// Logic expressions: boolean combination of named conditions

class LogicExpression
{
public:
  LogicExpression();
  virtual ~LogicExpression();
  virtual void accept (ExpressionVisitor &v) = 0;
};

typedef std::shared_ptr<LogicExpression> LogicExpressionPtr;

class ConditionReference : public LogicExpression
{
public:
  explicit ConditionReference (const std::string& conditionName);
  ~ConditionReference();
  void accept (ExpressionVisitor &v);

  const std::string& getName() const
  {
    return mName;
  }

private:
  std::string mName;
};

class BinaryLogicExpr : public LogicExpression
{
public:
  BinaryLogicExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs);
  virtual ~BinaryLogicExpr() = 0;

  LogicExpression *getLHS() const
  {
    return mLeftHandSide.get();
  }

  LogicExpression *getRHS() const
  {
    return mRightHandSide.get();
  }

private:
  LogicExpressionPtr mLeftHandSide;
  LogicExpressionPtr mRightHandSide;
};

class AndExpr : public BinaryLogicExpr
{
public:
  AndExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs);
  ~AndExpr();
  void accept (ExpressionVisitor &v);
};

class OrExpr : public BinaryLogicExpr
{
public:
  OrExpr (LogicExpressionPtr lhs, LogicExpressionPtr rhs);
  ~OrExpr();
  void accept (ExpressionVisitor &v);
};

class NotExpr : public LogicExpression
{
public:
  explicit NotExpr (LogicExpressionPtr operand);
  ~NotExpr();
  void accept (ExpressionVisitor &v);

  LogicExpression *getOperand() const
  {
    return mOperand.get();
  }

private:
  LogicExpressionPtr mOperand;
};

/////////////////////

/**
 * @brief Visitor over every node type of the condition and logic trees.
 */
class ExpressionVisitor
{
public:
  ExpressionVisitor();
  virtual ~ExpressionVisitor();

  virtual void visit (NumericLiteral *) = 0;
  virtual void visit (ColumnReference *) = 0;
  virtual void visit (NegateExpr *) = 0;
  virtual void visit (ArithmeticExpr *) = 0;
  virtual void visit (ComparisonExpr *) = 0;
  virtual void visit (ConditionReference *) = 0;
  virtual void visit (AndExpr *) = 0;
  virtual void visit (OrExpr *) = 0;
  virtual void visit (NotExpr *) = 0;
};

} // namespace alphaflow_expr

#endif // EXPRESSION_AST_H
