#include "Narrata/scripting/lexer.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace Narrata::scripting {

// The ctype functions require input in range [0, UCHAR_MAX] or EOF
namespace {
inline bool safeIsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

inline bool safeIsAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

inline bool safeIsAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

// UTF-8 lead and continuation bytes are accepted inside identifiers so state
// keys may use non-Latin names
inline bool isIdentifierStart(char c) {
  return safeIsAlpha(c) || c == '_' || c == '$' || static_cast<unsigned char>(c) >= 0x80;
}

inline bool isIdentifierPart(char c) {
  return safeIsAlnum(c) || c == '_' || c == '$' || static_cast<unsigned char>(c) >= 0x80;
}
} // anonymous namespace

const char* tokenTypeName(TokenType type) {
  switch (type) {
  case TokenType::Number:
    return "number";
  case TokenType::String:
    return "string";
  case TokenType::Identifier:
    return "identifier";
  case TokenType::True:
    return "'true'";
  case TokenType::False:
    return "'false'";
  case TokenType::Null:
    return "'null'";
  case TokenType::And:
  case TokenType::AmpAmp:
    return "'&&'";
  case TokenType::Or:
  case TokenType::PipePipe:
    return "'||'";
  case TokenType::Not:
  case TokenType::Bang:
    return "'!'";
  case TokenType::LeftParen:
    return "'('";
  case TokenType::RightParen:
    return "')'";
  case TokenType::LeftBracket:
    return "'['";
  case TokenType::RightBracket:
    return "']'";
  case TokenType::Dot:
    return "'.'";
  case TokenType::Comma:
    return "','";
  case TokenType::Semicolon:
    return "';'";
  case TokenType::Newline:
    return "newline";
  case TokenType::Plus:
    return "'+'";
  case TokenType::Minus:
    return "'-'";
  case TokenType::Star:
    return "'*'";
  case TokenType::Slash:
    return "'/'";
  case TokenType::Percent:
    return "'%'";
  case TokenType::Equal:
    return "'=='";
  case TokenType::NotEqual:
    return "'!='";
  case TokenType::Less:
    return "'<'";
  case TokenType::LessEqual:
    return "'<='";
  case TokenType::Greater:
    return "'>'";
  case TokenType::GreaterEqual:
    return "'>='";
  case TokenType::Assign:
    return "'='";
  case TokenType::PlusAssign:
    return "'+='";
  case TokenType::MinusAssign:
    return "'-='";
  case TokenType::StarAssign:
    return "'*='";
  case TokenType::SlashAssign:
    return "'/='";
  case TokenType::PlusPlus:
    return "'++'";
  case TokenType::MinusMinus:
    return "'--'";
  case TokenType::EndOfFile:
    return "end of input";
  case TokenType::Error:
    return "error";
  }
  return "token";
}

Lexer::Lexer()
    : m_source(), m_start(0), m_current(0), m_line(1), m_column(1), m_startColumn(1) {
  initKeywords();
}

Lexer::~Lexer() = default;

void Lexer::initKeywords() {
  m_keywords["true"] = TokenType::True;
  m_keywords["false"] = TokenType::False;
  m_keywords["null"] = TokenType::Null;
  m_keywords["undefined"] = TokenType::Null;
  m_keywords["and"] = TokenType::And;
  m_keywords["or"] = TokenType::Or;
  m_keywords["not"] = TokenType::Not;
}

void Lexer::reset() {
  m_source = {};
  m_start = 0;
  m_current = 0;
  m_line = 1;
  m_column = 1;
  m_startColumn = 1;
}

Result<std::vector<Token>, ScriptError> Lexer::tokenize(std::string_view source) {
  reset();
  m_source = source;

  std::vector<Token> tokens;
  tokens.reserve(source.size() / 3 + 1);

  while (true) {
    Token token = scanToken();

    if (token.type == TokenType::Error) {
      return Result<std::vector<Token>, ScriptError>::error(
          ScriptError(ScriptErrorStage::Lexer, token.lexeme, token.location));
    }

    bool done = token.type == TokenType::EndOfFile;
    tokens.push_back(std::move(token));
    if (done) {
      break;
    }
  }

  return Result<std::vector<Token>, ScriptError>::ok(std::move(tokens));
}

bool Lexer::isAtEnd() const { return m_current >= m_source.size(); }

char Lexer::peek() const {
  if (isAtEnd())
    return '\0';
  return m_source[m_current];
}

char Lexer::peekNext() const {
  if (m_current + 1 >= m_source.size())
    return '\0';
  return m_source[m_current + 1];
}

char Lexer::advance() {
  char c = m_source[m_current++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool Lexer::match(char expected) {
  if (isAtEnd())
    return false;
  if (m_source[m_current] != expected)
    return false;
  advance();
  return true;
}

void Lexer::skipWhitespace() {
  while (!isAtEnd()) {
    char c = peek();
    switch (c) {
    case ' ':
    case '\r':
    case '\t':
      advance();
      break;
    default:
      return;
    }
  }
}

void Lexer::skipLineComment() {
  while (!isAtEnd() && peek() != '\n') {
    advance();
  }
}

Token Lexer::scanToken() {
  skipWhitespace();

  m_start = m_current;
  m_startColumn = m_column;

  if (isAtEnd()) {
    return makeToken(TokenType::EndOfFile);
  }

  // Record the location before advance() moves past a newline
  u32 startLine = m_line;
  char c = advance();

  if (c == '\n') {
    return Token(TokenType::Newline, "\n", SourceLocation(startLine, m_startColumn));
  }

  if (c == '/' && match('/')) {
    skipLineComment();
    return scanToken();
  }

  if (safeIsDigit(c)) {
    return scanNumber();
  }

  if (isIdentifierStart(c)) {
    return scanIdentifier();
  }

  if (c == '"' || c == '\'') {
    return scanString(c);
  }

  switch (c) {
  case '(':
    return makeToken(TokenType::LeftParen);
  case ')':
    return makeToken(TokenType::RightParen);
  case '[':
    return makeToken(TokenType::LeftBracket);
  case ']':
    return makeToken(TokenType::RightBracket);
  case ',':
    return makeToken(TokenType::Comma);
  case ';':
    return makeToken(TokenType::Semicolon);
  case '.':
    return makeToken(TokenType::Dot);
  case '%':
    return makeToken(TokenType::Percent);

  case '+':
    if (match('+'))
      return makeToken(TokenType::PlusPlus);
    if (match('='))
      return makeToken(TokenType::PlusAssign);
    return makeToken(TokenType::Plus);

  case '-':
    if (match('-'))
      return makeToken(TokenType::MinusMinus);
    if (match('='))
      return makeToken(TokenType::MinusAssign);
    return makeToken(TokenType::Minus);

  case '*':
    if (match('='))
      return makeToken(TokenType::StarAssign);
    return makeToken(TokenType::Star);

  case '/':
    if (match('='))
      return makeToken(TokenType::SlashAssign);
    return makeToken(TokenType::Slash);

  case '=':
    if (match('=')) {
      match('='); // '===' is accepted as '=='
      return makeToken(TokenType::Equal);
    }
    return makeToken(TokenType::Assign);

  case '!':
    if (match('=')) {
      match('=');
      return makeToken(TokenType::NotEqual);
    }
    return makeToken(TokenType::Bang);

  case '<':
    if (match('='))
      return makeToken(TokenType::LessEqual);
    return makeToken(TokenType::Less);

  case '>':
    if (match('='))
      return makeToken(TokenType::GreaterEqual);
    return makeToken(TokenType::Greater);

  case '&':
    if (match('&'))
      return makeToken(TokenType::AmpAmp);
    return errorToken("Unexpected character '&' (did you mean '&&'?)");

  case '|':
    if (match('|'))
      return makeToken(TokenType::PipePipe);
    return errorToken("Unexpected character '|' (did you mean '||'?)");
  }

  return errorToken(std::string("Unexpected character '") + c + "'");
}

Token Lexer::makeToken(TokenType type) {
  std::string lexeme(m_source.substr(m_start, m_current - m_start));
  return Token(type, std::move(lexeme), SourceLocation(m_line, m_startColumn));
}

Token Lexer::errorToken(const std::string& message) {
  return Token(TokenType::Error, message, SourceLocation(m_line, m_startColumn));
}

Token Lexer::scanString(char quote) {
  std::string value;

  while (!isAtEnd() && peek() != quote) {
    if (peek() == '\n') {
      return errorToken("Unterminated string (newline in string literal)");
    }

    if (peek() == '\\') {
      advance();
      if (isAtEnd()) {
        return errorToken("Unterminated string (escape at end)");
      }

      char escaped = advance();
      switch (escaped) {
      case 'n':
        value += '\n';
        break;
      case 't':
        value += '\t';
        break;
      case 'r':
        value += '\r';
        break;
      case '\\':
        value += '\\';
        break;
      case '"':
        value += '"';
        break;
      case '\'':
        value += '\'';
        break;
      default:
        return errorToken("Invalid escape sequence");
      }
    } else {
      value += advance();
    }
  }

  if (isAtEnd()) {
    return errorToken("Unterminated string");
  }

  advance(); // Closing quote

  return Token(TokenType::String, std::move(value), SourceLocation(m_line, m_startColumn));
}

Token Lexer::scanNumber() {
  while (!isAtEnd() && safeIsDigit(peek())) {
    advance();
  }

  bool isFloat = false;
  if (peek() == '.' && safeIsDigit(peekNext())) {
    isFloat = true;
    advance(); // Consume '.'

    while (!isAtEnd() && safeIsDigit(peek())) {
      advance();
    }
  }

  std::string lexeme(m_source.substr(m_start, m_current - m_start));
  Token token(TokenType::Number, lexeme, SourceLocation(m_line, m_startColumn));

  if (isFloat) {
    token.numberValue = std::strtod(lexeme.c_str(), nullptr);
    token.isInteger = false;
  } else {
    i64 parsed = 0;
    auto [ptr, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), parsed);
    if (ec != std::errc() || ptr != lexeme.data() + lexeme.size()) {
      // Out of i64 range: keep it as a floating-point literal
      token.numberValue = std::strtod(lexeme.c_str(), nullptr);
      token.isInteger = false;
    } else {
      token.intValue = parsed;
      token.numberValue = static_cast<f64>(parsed);
      token.isInteger = true;
    }
  }

  return token;
}

Token Lexer::scanIdentifier() {
  while (!isAtEnd() && isIdentifierPart(peek())) {
    advance();
  }

  std::string lexeme(m_source.substr(m_start, m_current - m_start));
  TokenType type = identifierType(lexeme);

  return Token(type, std::move(lexeme), SourceLocation(m_line, m_startColumn));
}

TokenType Lexer::identifierType(const std::string& lexeme) const {
  auto it = m_keywords.find(lexeme);
  if (it != m_keywords.end()) {
    return it->second;
  }
  return TokenType::Identifier;
}

} // namespace Narrata::scripting
