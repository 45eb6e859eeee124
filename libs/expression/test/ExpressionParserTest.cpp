#include <catch2/catch.hpp>
#include <string>
#include "ExpressionParseDriver.h"
#include "ExpressionFormatter.h"
#include "ExpressionException.h"

using namespace alphaflow_expr;

namespace
{
  std::string formatCondition (const std::string& text)
  {
    ExpressionParseDriver driver(text);
    ComparisonExprPtr condition = driver.parseCondition();
    return ExpressionFormatter::format(condition.get());
  }

  std::string formatLogic (const std::string& text)
  {
    ExpressionParseDriver driver(text);
    LogicExpressionPtr logic = driver.parseLogic();
    return ExpressionFormatter::format(logic.get());
  }

  std::size_t syntaxErrorPosition (const std::string& text, bool logic)
  {
    ExpressionParseDriver driver(text);
    try
      {
	if (logic)
	  driver.parseLogic();
	else
	  driver.parseCondition();
      }
    catch (const alphaflow::ExpressionSyntaxError& e)
      {
	REQUIRE(e.getExpression() == text);
	return e.getPosition();
      }

    FAIL("expected a syntax error for '" << text << "'");
    return 0;
  }
}

TEST_CASE("Condition parsing", "[ExpressionParser]")
{
  SECTION("simple comparisons")
    {
      REQUIRE(formatCondition("close > 100") == "close > 100");
      REQUIRE(formatCondition("rsi<=30") == "rsi <= 30");
      REQUIRE(formatCondition("ema_20 >= ema_50") == "ema_20 >= ema_50");
      REQUIRE(formatCondition("open == close") == "open == close");
      REQUIRE(formatCondition("open != close") == "open != close");
      REQUIRE(formatCondition("low < 1.5") == "low < 1.5");
    }

  SECTION("multiplication binds tighter than addition")
    {
      REQUIRE(formatCondition("a + b * 2 > c") == "(a + (b * 2)) > c");
      REQUIRE(formatCondition("a * b + 2 > c") == "((a * b) + 2) > c");
    }

  SECTION("arithmetic is left associative")
    {
      REQUIRE(formatCondition("a - b - c < 0") == "((a - b) - c) < 0");
      REQUIRE(formatCondition("a / b / c < 0") == "((a / b) / c) < 0");
    }

  SECTION("parentheses")
    {
      REQUIRE(formatCondition("(a + b) * 2 > c") == "((a + b) * 2) > c");
      REQUIRE(formatCondition("(close > open)") == "close > open");
      REQUIRE(formatCondition("((high - low)) > 1") == "(high - low) > 1");
    }

  SECTION("unary minus and plus")
    {
      REQUIRE(formatCondition("-macd > 0") == "-macd > 0");
      REQUIRE(formatCondition("close > -5") == "close > -5");
      REQUIRE(formatCondition("+close > 1") == "close > 1");
    }

  SECTION("number forms")
    {
      REQUIRE(formatCondition("x > .5") == "x > 0.5");
      REQUIRE(formatCondition("x > 1e3") == "x > 1000");
      REQUIRE(formatCondition("x > 2.5E-1") == "x > 0.25");
    }
}

TEST_CASE("Condition syntax errors", "[ExpressionParser]")
{
  REQUIRE_THROWS_AS(formatCondition(""), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("close"), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("close > 1 > 2"), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("close > 1 AND open > 2"), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("(close > 1"), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("close = 1"), alphaflow::ExpressionSyntaxError);
  REQUIRE_THROWS_AS(formatCondition("close ! 1"), alphaflow::ExpressionSyntaxError);

  SECTION("the error position points at the offending token")
    {
      REQUIRE(syntaxErrorPosition("close >", false) == 7);
      REQUIRE(syntaxErrorPosition("close >> 5", false) == 7);
      REQUIRE(syntaxErrorPosition("close > $5", false) == 8);
    }

  SECTION("errors are ExpressionExceptions")
    {
      REQUIRE_THROWS_AS(formatCondition("close >"), alphaflow::ExpressionException);
    }
}

TEST_CASE("Logic parsing", "[ExpressionParser]")
{
  SECTION("precedence NOT over AND over OR")
    {
      REQUIRE(formatLogic("NOT A AND B OR C") == "((NOT A AND B) OR C)");
      REQUIRE(formatLogic("A OR B AND C") == "(A OR (B AND C))");
    }

  SECTION("keywords are case insensitive")
    {
      REQUIRE(formatLogic("cond1 and not cond2") == "(cond1 AND NOT cond2)");
      REQUIRE(formatLogic("COND1 Or COND2") == "(COND1 OR COND2)");
    }

  SECTION("parentheses group")
    {
      REQUIRE(formatLogic("(COND1 OR COND2) AND COND3") == "((COND1 OR COND2) AND COND3)");
      REQUIRE(formatLogic("NOT NOT COND1") == "NOT NOT COND1");
      REQUIRE(formatLogic("COND1") == "COND1");
    }

  SECTION("errors")
    {
      REQUIRE_THROWS_AS(formatLogic(""), alphaflow::ExpressionSyntaxError);
      REQUIRE_THROWS_AS(formatLogic("COND1 AND"), alphaflow::ExpressionSyntaxError);
      REQUIRE_THROWS_AS(formatLogic("COND1 COND2"), alphaflow::ExpressionSyntaxError);
      REQUIRE_THROWS_AS(formatLogic("COND1 > COND2"), alphaflow::ExpressionSyntaxError);
      REQUIRE_THROWS_AS(formatLogic("(COND1 OR COND2"), alphaflow::ExpressionSyntaxError);
      REQUIRE(syntaxErrorPosition("COND1 AND OR COND2", true) == 10);
    }
}

TEST_CASE("A driver can be reused", "[ExpressionParser]")
{
  ExpressionParseDriver driver("COND1 AND COND2");
  LogicExpressionPtr first = driver.parseLogic();
  LogicExpressionPtr second = driver.parseLogic();

  REQUIRE(ExpressionFormatter::format(first.get()) == ExpressionFormatter::format(second.get()));
}
