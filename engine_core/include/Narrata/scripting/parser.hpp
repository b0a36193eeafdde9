#pragma once

#include "Narrata/core/result.hpp"
#include "Narrata/scripting/ast.hpp"
#include "Narrata/scripting/script_error.hpp"
#include <vector>

namespace Narrata::scripting {

/**
 * @brief Recursive-descent parser over the Lexer's token stream
 *
 * Precedence, lowest first: || / or, && / and, == !=, < <= > >=, + -,
 * * / %, unary ! not -, then postfix member access, indexing and calls.
 */
class Parser {
public:
  Parser();
  ~Parser();

  /**
   * @brief Parse a single expression; newlines are insignificant
   */
  [[nodiscard]] Result<ExprPtr, ScriptError> parseExpression(const std::vector<Token>& tokens);

  /**
   * @brief Parse assignment statements separated by ';' or newlines
   */
  [[nodiscard]] Result<Script, ScriptError> parseScript(const std::vector<Token>& tokens);

private:
  void reset(const std::vector<Token>& tokens, bool keepNewlines);

  ExprPtr expression();
  ExprPtr logicalOr();
  ExprPtr logicalAnd();
  ExprPtr equality();
  ExprPtr comparison();
  ExprPtr term();
  ExprPtr factor();
  ExprPtr unary();
  ExprPtr postfix();
  ExprPtr primary();

  Statement statement();
  static bool isAssignable(const Expr& expr);

  [[nodiscard]] bool isAtEnd() const;
  [[nodiscard]] const Token& peek() const;
  [[nodiscard]] const Token& previous() const;
  [[nodiscard]] bool check(TokenType type) const;
  const Token& advance();
  bool match(TokenType type);
  const Token& consume(TokenType type, const char* message);
  [[noreturn]] void fail(const Token& at, const std::string& message) const;

  std::vector<Token> m_tokens;
  size_t m_current;
};

} // namespace Narrata::scripting
