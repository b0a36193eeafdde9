#pragma once

#include "Narrata/core/types.hpp"
#include <string>
#include <utility>

namespace Narrata::scripting {

enum class TokenType {
  // Literals
  Number,
  String,
  Identifier,

  // Keywords
  True,
  False,
  Null,
  And,
  Or,
  Not,

  // Delimiters
  LeftParen,
  RightParen,
  LeftBracket,
  RightBracket,
  Dot,
  Comma,
  Semicolon,
  Newline,

  // Arithmetic
  Plus,
  Minus,
  Star,
  Slash,
  Percent,

  // Comparison
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,

  // Logical symbols
  AmpAmp,
  PipePipe,
  Bang,

  // Assignment
  Assign,
  PlusAssign,
  MinusAssign,
  StarAssign,
  SlashAssign,
  PlusPlus,
  MinusMinus,

  EndOfFile,
  Error
};

struct SourceLocation {
  u32 line = 1;
  u32 column = 1;

  SourceLocation() = default;
  SourceLocation(u32 l, u32 c) : line(l), column(c) {}
};

struct Token {
  TokenType type = TokenType::Error;
  std::string lexeme;
  SourceLocation location;
  f64 numberValue = 0.0;
  i64 intValue = 0;
  bool isInteger = false;

  Token() = default;
  Token(TokenType t, std::string text, SourceLocation loc)
      : type(t), lexeme(std::move(text)), location(loc) {}
};

[[nodiscard]] const char* tokenTypeName(TokenType type);

} // namespace Narrata::scripting
