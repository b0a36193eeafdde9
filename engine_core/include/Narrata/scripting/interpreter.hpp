#pragma once

/**
 * @file interpreter.hpp
 * @brief Sandboxed evaluation of story conditions and enter/exit hooks
 *
 * Conditions and hooks are compiled once into a syntax tree and evaluated
 * against a game-state mapping. Evaluation can only read the mapping and,
 * for hooks, assign paths beneath it; nothing else is reachable.
 */

#include "Narrata/core/result.hpp"
#include "Narrata/scripting/ast.hpp"
#include "Narrata/scripting/script_error.hpp"
#include "Narrata/scripting/value.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace Narrata::scripting {

/**
 * @brief Tree-walking evaluator bound to one state mapping
 */
class Interpreter {
public:
  explicit Interpreter(const Value& state);

  [[nodiscard]] Result<Value, ScriptError> evaluate(const Expr& expr) const;

  /**
   * @brief Run every statement against @p state in order
   *
   * Stops at the first failing statement. Statements before it have
   * already been applied; callers wanting all-or-nothing pass a copy.
   */
  static Result<void, ScriptError> execute(const Script& script, Value& state);

private:
  Value eval(const Expr& expr) const;
  Value evalMember(const Expr& expr) const;
  Value evalIndex(const Expr& expr) const;
  Value evalUnary(const Expr& expr) const;
  Value evalBinary(const Expr& expr) const;
  Value evalCall(const Expr& expr) const;

  const Value& m_state;
};

class CompiledExpression {
public:
  CompiledExpression() = default;

  [[nodiscard]] static Result<CompiledExpression, ScriptError> compile(std::string_view source);

  [[nodiscard]] Result<Value, ScriptError> evaluate(const Value& state) const;

  /**
   * @brief Evaluate and reduce the result to its truthiness
   */
  [[nodiscard]] Result<bool, ScriptError> test(const Value& state) const;

  [[nodiscard]] const std::string& source() const { return m_source; }
  [[nodiscard]] bool isValid() const { return m_root != nullptr; }

private:
  std::string m_source;
  std::shared_ptr<const Expr> m_root;
};

class CompiledScript {
public:
  CompiledScript() = default;

  [[nodiscard]] static Result<CompiledScript, ScriptError> compile(std::string_view source);

  /**
   * @brief Apply the script to @p state transactionally
   *
   * The statements run against a copy which replaces @p state only when
   * every statement succeeded.
   */
  [[nodiscard]] Result<void, ScriptError> execute(Value& state) const;

  [[nodiscard]] const std::string& source() const { return m_source; }
  [[nodiscard]] size_t statementCount() const {
    return m_script ? m_script->statements.size() : 0;
  }

private:
  std::string m_source;
  std::shared_ptr<const Script> m_script;
};

} // namespace Narrata::scripting
