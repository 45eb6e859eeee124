#include "ExpressionScanner.h"
#include <cctype>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

namespace alphaflow_expr
{

namespace
{
  bool isIdentifierStart (char c)
  {
    return std::isalpha (static_cast<unsigned char>(c)) || c == '_';
  }

  bool isIdentifierChar (char c)
  {
    return std::isalnum (static_cast<unsigned char>(c)) || c == '_';
  }

  bool isDigit (char c)
  {
    return std::isdigit (static_cast<unsigned char>(c)) != 0;
  }
}

ExpressionScanner::ExpressionScanner (const std::string& text)
  : mText(text),
    mPosition(0),
    mTokenStart(0),
    mMode(StartMode::CONDITION),
    mStartTokenSent(false)
{}

void ExpressionScanner::reset (StartMode mode)
{
  mPosition = 0;
  mTokenStart = 0;
  mMode = mode;
  mStartTokenSent = false;
}

bool ExpressionScanner::peekIs (char c) const
{
  return (mPosition < mText.size()) && (mText[mPosition] == c);
}

ExpressionParser::symbol_type ExpressionScanner::get_next_token()
{
  if (!mStartTokenSent)
    {
      mStartTokenSent = true;
      if (mMode == StartMode::CONDITION)
	return ExpressionParser::make_START_CONDITION();
      else
	return ExpressionParser::make_START_LOGIC();
    }

  while (mPosition < mText.size() && std::isspace (static_cast<unsigned char>(mText[mPosition])))
    mPosition++;

  mTokenStart = mPosition;
  if (mPosition >= mText.size())
    return ExpressionParser::make_END();

  char c = mText[mPosition];

  if (isIdentifierStart (c))
    return scanIdentifier();

  if (isDigit (c) || (c == '.' && mPosition + 1 < mText.size() && isDigit (mText[mPosition + 1])))
    return scanNumber();

  mPosition++;
  switch (c)
    {
    case '(':
      return ExpressionParser::make_LPAREN();
    case ')':
      return ExpressionParser::make_RPAREN();
    case '+':
      return ExpressionParser::make_PLUS();
    case '-':
      return ExpressionParser::make_MINUS();
    case '*':
      return ExpressionParser::make_STAR();
    case '/':
      return ExpressionParser::make_SLASH();
    case '<':
      if (peekIs ('='))
	{
	  mPosition++;
	  return ExpressionParser::make_LE();
	}
      return ExpressionParser::make_LT();
    case '>':
      if (peekIs ('='))
	{
	  mPosition++;
	  return ExpressionParser::make_GE();
	}
      return ExpressionParser::make_GT();
    case '=':
      if (peekIs ('='))
	{
	  mPosition++;
	  return ExpressionParser::make_EQ();
	}
      throw ExpressionParser::syntax_error ("single '=' is not an operator, use '=='");
    case '!':
      if (peekIs ('='))
	{
	  mPosition++;
	  return ExpressionParser::make_NE();
	}
      throw ExpressionParser::syntax_error ("'!' is not an operator, use '!=' or NOT");
    default:
      throw ExpressionParser::syntax_error (std::string ("invalid character '") + c + "'");
    }
}

ExpressionParser::symbol_type ExpressionScanner::scanIdentifier()
{
  std::size_t start = mPosition;
  while (mPosition < mText.size() && isIdentifierChar (mText[mPosition]))
    mPosition++;

  std::string word (mText.substr (start, mPosition - start));

  if (boost::algorithm::iequals (word, "and"))
    return ExpressionParser::make_AND();
  if (boost::algorithm::iequals (word, "or"))
    return ExpressionParser::make_OR();
  if (boost::algorithm::iequals (word, "not"))
    return ExpressionParser::make_NOT();

  return ExpressionParser::make_IDENTIFIER (word);
}

ExpressionParser::symbol_type ExpressionScanner::scanNumber()
{
  std::size_t start = mPosition;

  while (mPosition < mText.size() && isDigit (mText[mPosition]))
    mPosition++;

  if (peekIs ('.') && mPosition + 1 < mText.size() && isDigit (mText[mPosition + 1]))
    {
      mPosition++;
      while (mPosition < mText.size() && isDigit (mText[mPosition]))
	mPosition++;
    }

  // Exponent is only consumed when digits follow it
  if (peekIs ('e') || peekIs ('E'))
    {
      std::size_t exponentStart = mPosition + 1;
      if (exponentStart < mText.size() && (mText[exponentStart] == '+' || mText[exponentStart] == '-'))
	exponentStart++;

      if (exponentStart < mText.size() && isDigit (mText[exponentStart]))
	{
	  mPosition = exponentStart;
	  while (mPosition < mText.size() && isDigit (mText[mPosition]))
	    mPosition++;
	}
    }

  std::string literal (mText.substr (start, mPosition - start));
  try
    {
      return ExpressionParser::make_NUMBER (boost::lexical_cast<double>(literal));
    }
  catch (const boost::bad_lexical_cast&)
    {
      throw ExpressionParser::syntax_error ("invalid numeric literal '" + literal + "'");
    }
}

} // namespace alphaflow_expr
