#pragma once

#include "Narrata/core/result.hpp"
#include "Narrata/scripting/script_error.hpp"
#include "Narrata/scripting/token.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Narrata::scripting {

/**
 * @brief Tokenizer for story conditions and enter/exit hooks
 *
 * Produces the token stream consumed by Parser. Newlines are kept as
 * tokens because hook scripts use them as statement separators; the
 * expression parser discards them.
 */
class Lexer {
public:
  Lexer();
  ~Lexer();

  [[nodiscard]] Result<std::vector<Token>, ScriptError> tokenize(std::string_view source);

private:
  void initKeywords();
  void reset();

  [[nodiscard]] bool isAtEnd() const;
  [[nodiscard]] char peek() const;
  [[nodiscard]] char peekNext() const;
  char advance();
  bool match(char expected);

  void skipWhitespace();
  void skipLineComment();

  Token scanToken();
  Token makeToken(TokenType type);
  Token errorToken(const std::string& message);
  Token scanString(char quote);
  Token scanNumber();
  Token scanIdentifier();

  [[nodiscard]] TokenType identifierType(const std::string& lexeme) const;

  std::string_view m_source;
  size_t m_start;
  size_t m_current;
  u32 m_line;
  u32 m_column;
  u32 m_startColumn;
  std::unordered_map<std::string, TokenType> m_keywords;
};

} // namespace Narrata::scripting
