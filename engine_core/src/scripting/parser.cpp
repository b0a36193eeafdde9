#include "Narrata/scripting/parser.hpp"

namespace Narrata::scripting {

namespace {

// Unwinds the descent on the first syntax error; never leaves this file
struct ParseFailure {
  ScriptError error;
};

ExprPtr makeExpr(ExprKind kind, SourceLocation location) {
  return std::make_unique<Expr>(kind, location);
}

ExprPtr makeBinary(ExprKind kind, TokenType op, ExprPtr left, ExprPtr right,
                   SourceLocation location) {
  auto expr = makeExpr(kind, location);
  expr->op = op;
  expr->object = std::move(left);
  expr->other = std::move(right);
  return expr;
}

ExprPtr makeMember(ExprPtr object, std::string name, SourceLocation location) {
  auto expr = makeExpr(ExprKind::Member, location);
  expr->object = std::move(object);
  expr->name = std::move(name);
  return expr;
}

} // namespace

Parser::Parser() : m_current(0) {}

Parser::~Parser() = default;

void Parser::reset(const std::vector<Token>& tokens, bool keepNewlines) {
  m_tokens.clear();
  m_tokens.reserve(tokens.size() + 1);
  for (const auto& token : tokens) {
    if (token.type == TokenType::Newline && !keepNewlines) {
      continue;
    }
    m_tokens.push_back(token);
  }
  if (m_tokens.empty() || m_tokens.back().type != TokenType::EndOfFile) {
    SourceLocation loc = m_tokens.empty() ? SourceLocation{} : m_tokens.back().location;
    m_tokens.emplace_back(TokenType::EndOfFile, "", loc);
  }
  m_current = 0;
}

Result<ExprPtr, ScriptError> Parser::parseExpression(const std::vector<Token>& tokens) {
  reset(tokens, false);
  try {
    if (isAtEnd()) {
      fail(peek(), "Expected an expression");
    }
    ExprPtr expr = expression();
    if (!isAtEnd()) {
      fail(peek(), std::string("Unexpected ") + tokenTypeName(peek().type) +
                       " after end of expression");
    }
    return Result<ExprPtr, ScriptError>::ok(std::move(expr));
  } catch (const ParseFailure& failure) {
    return Result<ExprPtr, ScriptError>::error(failure.error);
  }
}

Result<Script, ScriptError> Parser::parseScript(const std::vector<Token>& tokens) {
  reset(tokens, true);
  Script script;
  try {
    while (!isAtEnd()) {
      if (match(TokenType::Newline) || match(TokenType::Semicolon)) {
        continue;
      }
      script.statements.push_back(statement());
      if (!isAtEnd() && !check(TokenType::Newline) && !check(TokenType::Semicolon)) {
        fail(peek(), std::string("Expected ';' or newline after statement, got ") +
                         tokenTypeName(peek().type));
      }
    }
    return Result<Script, ScriptError>::ok(std::move(script));
  } catch (const ParseFailure& failure) {
    return Result<Script, ScriptError>::error(failure.error);
  }
}

Statement Parser::statement() {
  Statement stmt;
  stmt.location = peek().location;
  stmt.target = postfix();

  if (!isAssignable(*stmt.target)) {
    fail(previous(), "Only paths under 'state' can be assigned");
  }

  if (match(TokenType::PlusPlus) || match(TokenType::MinusMinus)) {
    stmt.op = previous().type;
    return stmt;
  }

  if (match(TokenType::Assign) || match(TokenType::PlusAssign) ||
      match(TokenType::MinusAssign) || match(TokenType::StarAssign) ||
      match(TokenType::SlashAssign)) {
    stmt.op = previous().type;
    stmt.value = expression();
    return stmt;
  }

  fail(peek(), "Expected an assignment operator ('=', '+=', '-=', '*=', '/=', '++' or '--')");
}

bool Parser::isAssignable(const Expr& expr) {
  const Expr* node = &expr;
  bool hasSegment = false;
  while (node->kind == ExprKind::Member || node->kind == ExprKind::Index) {
    hasSegment = true;
    node = node->object.get();
  }
  return hasSegment && node->kind == ExprKind::StateRoot;
}

ExprPtr Parser::expression() { return logicalOr(); }

ExprPtr Parser::logicalOr() {
  ExprPtr expr = logicalAnd();
  while (match(TokenType::PipePipe) || match(TokenType::Or)) {
    SourceLocation loc = previous().location;
    ExprPtr right = logicalAnd();
    expr = makeBinary(ExprKind::Logical, TokenType::PipePipe, std::move(expr), std::move(right),
                      loc);
  }
  return expr;
}

ExprPtr Parser::logicalAnd() {
  ExprPtr expr = equality();
  while (match(TokenType::AmpAmp) || match(TokenType::And)) {
    SourceLocation loc = previous().location;
    ExprPtr right = equality();
    expr =
        makeBinary(ExprKind::Logical, TokenType::AmpAmp, std::move(expr), std::move(right), loc);
  }
  return expr;
}

ExprPtr Parser::equality() {
  ExprPtr expr = comparison();
  while (match(TokenType::Equal) || match(TokenType::NotEqual)) {
    const Token& op = previous();
    ExprPtr right = comparison();
    expr = makeBinary(ExprKind::Binary, op.type, std::move(expr), std::move(right), op.location);
  }
  return expr;
}

ExprPtr Parser::comparison() {
  ExprPtr expr = term();
  while (match(TokenType::Less) || match(TokenType::LessEqual) || match(TokenType::Greater) ||
         match(TokenType::GreaterEqual)) {
    const Token& op = previous();
    ExprPtr right = term();
    expr = makeBinary(ExprKind::Binary, op.type, std::move(expr), std::move(right), op.location);
  }
  return expr;
}

ExprPtr Parser::term() {
  ExprPtr expr = factor();
  while (match(TokenType::Plus) || match(TokenType::Minus)) {
    const Token& op = previous();
    ExprPtr right = factor();
    expr = makeBinary(ExprKind::Binary, op.type, std::move(expr), std::move(right), op.location);
  }
  return expr;
}

ExprPtr Parser::factor() {
  ExprPtr expr = unary();
  while (match(TokenType::Star) || match(TokenType::Slash) || match(TokenType::Percent)) {
    const Token& op = previous();
    ExprPtr right = unary();
    expr = makeBinary(ExprKind::Binary, op.type, std::move(expr), std::move(right), op.location);
  }
  return expr;
}

ExprPtr Parser::unary() {
  if (match(TokenType::Bang) || match(TokenType::Not) || match(TokenType::Minus) ||
      match(TokenType::Plus)) {
    const Token& op = previous();
    auto expr = makeExpr(ExprKind::Unary, op.location);
    expr->op = op.type == TokenType::Not ? TokenType::Bang : op.type;
    expr->object = unary();
    return expr;
  }
  return postfix();
}

ExprPtr Parser::postfix() {
  ExprPtr expr = primary();

  while (true) {
    if (match(TokenType::Dot)) {
      const Token& name = consume(TokenType::Identifier, "Expected property name after '.'");
      SourceLocation loc = name.location;
      std::string member = name.lexeme;

      if (match(TokenType::LeftParen)) {
        auto call = makeExpr(ExprKind::Call, loc);
        call->object = std::move(expr);
        call->name = std::move(member);
        if (!check(TokenType::RightParen)) {
          do {
            call->arguments.push_back(expression());
          } while (match(TokenType::Comma));
        }
        consume(TokenType::RightParen, "Expected ')' after arguments");
        expr = std::move(call);
      } else {
        expr = makeMember(std::move(expr), std::move(member), loc);
      }
    } else if (match(TokenType::LeftBracket)) {
      SourceLocation loc = previous().location;
      auto index = makeExpr(ExprKind::Index, loc);
      index->object = std::move(expr);
      index->other = expression();
      consume(TokenType::RightBracket, "Expected ']' after index");
      expr = std::move(index);
    } else {
      break;
    }
  }

  return expr;
}

ExprPtr Parser::primary() {
  const Token& token = peek();

  switch (token.type) {
  case TokenType::Number: {
    advance();
    auto expr = makeExpr(ExprKind::Literal, token.location);
    if (token.isInteger) {
      expr->literal = token.intValue;
    } else {
      expr->literal = token.numberValue;
    }
    return expr;
  }
  case TokenType::String: {
    advance();
    auto expr = makeExpr(ExprKind::Literal, token.location);
    expr->literal = token.lexeme;
    return expr;
  }
  case TokenType::True:
  case TokenType::False: {
    advance();
    auto expr = makeExpr(ExprKind::Literal, token.location);
    expr->literal = token.type == TokenType::True;
    return expr;
  }
  case TokenType::Null: {
    advance();
    return makeExpr(ExprKind::Literal, token.location);
  }
  case TokenType::Identifier: {
    advance();
    auto root = makeExpr(ExprKind::StateRoot, token.location);
    if (token.lexeme == "state") {
      return root;
    }
    // A bare name reads the state key of the same name
    return makeMember(std::move(root), token.lexeme, token.location);
  }
  case TokenType::LeftParen: {
    advance();
    ExprPtr expr = expression();
    consume(TokenType::RightParen, "Expected ')' after expression");
    return expr;
  }
  default:
    break;
  }

  fail(token, std::string("Unexpected ") + tokenTypeName(token.type));
}

bool Parser::isAtEnd() const { return peek().type == TokenType::EndOfFile; }

const Token& Parser::peek() const { return m_tokens[m_current]; }

const Token& Parser::previous() const { return m_tokens[m_current > 0 ? m_current - 1 : 0]; }

bool Parser::check(TokenType type) const { return peek().type == type; }

const Token& Parser::advance() {
  if (!isAtEnd()) {
    ++m_current;
  }
  return previous();
}

bool Parser::match(TokenType type) {
  if (!check(type)) {
    return false;
  }
  advance();
  return true;
}

const Token& Parser::consume(TokenType type, const char* message) {
  if (check(type)) {
    return advance();
  }
  fail(peek(), message);
}

void Parser::fail(const Token& at, const std::string& message) const {
  throw ParseFailure{ScriptError(ScriptErrorStage::Parser, message, at.location)};
}

} // namespace Narrata::scripting
