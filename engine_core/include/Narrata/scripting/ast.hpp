#pragma once

/**
 * @file ast.hpp
 * @brief Syntax tree for condition expressions and hook scripts
 */

#include "Narrata/scripting/token.hpp"
#include "Narrata/scripting/value.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Narrata::scripting {

enum class ExprKind {
  Literal,   // literal
  StateRoot, // the game-state mapping itself
  Member,    // object.name
  Index,     // object[key]
  Unary,     // op object
  Binary,    // object op other
  Logical,   // object &&/|| other, short-circuit
  Call       // object.name(arguments...)
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Expr {
  ExprKind kind = ExprKind::Literal;
  SourceLocation location;

  Value literal;
  std::string name;
  TokenType op = TokenType::Error;
  ExprPtr object;
  ExprPtr other;
  std::vector<ExprPtr> arguments;

  Expr() = default;
  Expr(ExprKind k, SourceLocation loc) : kind(k), location(loc) {}
};

/**
 * @brief One script statement: `target op value`, or `target++` / `target--`
 *
 * `op` is one of Assign, PlusAssign, MinusAssign, StarAssign, SlashAssign,
 * PlusPlus or MinusMinus. `value` is null for the increment forms.
 */
struct Statement {
  TokenType op = TokenType::Assign;
  ExprPtr target;
  ExprPtr value;
  SourceLocation location;
};

struct Script {
  std::vector<Statement> statements;
};

} // namespace Narrata::scripting
