#ifndef EXPRESSION_SCANNER_H
#define EXPRESSION_SCANNER_H

#include <cstddef>
#include <string>
#include "ExpressionParser.hpp"

namespace alphaflow_expr
{

/**
 * @brief Tokenizer feeding the generated ExpressionParser.
 *
 * Works on an in-memory string. The first token returned after reset() is the
 * start token selecting the condition or logic sub-grammar. AND, OR and NOT
 * are recognized case insensitively in both modes so a condition that uses
 * them is rejected by the grammar rather than read as a column name.
 *
 * Characters that cannot begin any token raise ExpressionParser::syntax_error,
 * which the parser reports through ExpressionParser::error.
 */
class ExpressionScanner
{
public:
  enum class StartMode { CONDITION, LOGIC };

  explicit ExpressionScanner (const std::string& text);

  void reset (StartMode mode);

  ExpressionParser::symbol_type get_next_token();

  /**
   * @return zero based offset of the most recently scanned token.
   */
  std::size_t getTokenPosition() const
  {
    return mTokenStart;
  }

private:
  ExpressionParser::symbol_type scanIdentifier();
  ExpressionParser::symbol_type scanNumber();
  bool peekIs (char c) const;

private:
  std::string mText;
  std::size_t mPosition;
  std::size_t mTokenStart;
  StartMode mMode;
  bool mStartTokenSent;
};

} // namespace alphaflow_expr

#endif
