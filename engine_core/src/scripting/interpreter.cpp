#include "Narrata/scripting/interpreter.hpp"
#include "Narrata/scripting/lexer.hpp"
#include "Narrata/scripting/parser.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace Narrata::scripting {

namespace {

struct EvalFailure {
  ScriptError error;
};

[[noreturn]] void raise(SourceLocation location, std::string message) {
  throw EvalFailure{ScriptError(ScriptErrorStage::Runtime, std::move(message), location)};
}

const char* typeName(const Value& value) {
  switch (value.type()) {
  case Value::value_t::null:
  case Value::value_t::discarded:
    return "null";
  case Value::value_t::boolean:
    return "boolean";
  case Value::value_t::string:
    return "string";
  case Value::value_t::array:
    return "array";
  case Value::value_t::object:
    return "object";
  default:
    return "number";
  }
}

struct Number {
  bool isInteger = true;
  i64 i = 0;
  f64 d = 0.0;

  [[nodiscard]] f64 asDouble() const { return isInteger ? static_cast<f64>(i) : d; }
};

// Missing values count as zero so counters can be bumped without initialising
std::optional<Number> toNumber(const Value& value) {
  if (value.is_number_float()) {
    return Number{false, 0, value.get<f64>()};
  }
  if (value.is_number_unsigned() &&
      value.get<u64>() > static_cast<u64>(std::numeric_limits<i64>::max())) {
    return Number{false, 0, static_cast<f64>(value.get<u64>())};
  }
  if (value.is_number()) {
    return Number{true, value.get<i64>(), 0.0};
  }
  if (value.is_boolean()) {
    return Number{true, value.get<bool>() ? 1 : 0, 0.0};
  }
  if (value.is_null()) {
    return Number{true, 0, 0.0};
  }
  return std::nullopt;
}

Number requireNumber(const Value& value, TokenType op, SourceLocation location) {
  auto number = toNumber(value);
  if (!number) {
    raise(location, std::string("Operator ") + tokenTypeName(op) + " cannot be applied to " +
                        typeName(value));
  }
  return *number;
}

Value fromDouble(f64 d) { return Value(d); }

constexpr i64 kMinInt = std::numeric_limits<i64>::min();
constexpr i64 kMaxInt = std::numeric_limits<i64>::max();

// Integer results outside the i64 range continue as doubles
Value checkedAdd(i64 a, i64 b) {
  if ((b > 0 && a > kMaxInt - b) || (b < 0 && a < kMinInt - b)) {
    return fromDouble(static_cast<f64>(a) + static_cast<f64>(b));
  }
  return Value(a + b);
}

Value checkedSub(i64 a, i64 b) {
  if ((b < 0 && a > kMaxInt + b) || (b > 0 && a < kMinInt + b)) {
    return fromDouble(static_cast<f64>(a) - static_cast<f64>(b));
  }
  return Value(a - b);
}

Value checkedMul(i64 a, i64 b) {
  bool overflow = false;
  if (a > 0) {
    overflow = b > 0 ? a > kMaxInt / b : b < kMinInt / a;
  } else if (b > 0) {
    overflow = a < kMinInt / b;
  } else {
    overflow = a != 0 && b < kMaxInt / a;
  }
  if (overflow) {
    return fromDouble(static_cast<f64>(a) * static_cast<f64>(b));
  }
  return Value(a * b);
}

Value checkedNegate(i64 a) {
  if (a == kMinInt) {
    return fromDouble(-static_cast<f64>(a));
  }
  return Value(-a);
}

Value arithmetic(TokenType op, const Value& left, const Value& right, SourceLocation location) {
  if (op == TokenType::Plus && (left.is_string() || right.is_string())) {
    return Value(toDisplayString(left) + toDisplayString(right));
  }

  Number a = requireNumber(left, op, location);
  Number b = requireNumber(right, op, location);
  bool integral = a.isInteger && b.isInteger;

  switch (op) {
  case TokenType::Plus:
    return integral ? checkedAdd(a.i, b.i) : fromDouble(a.asDouble() + b.asDouble());
  case TokenType::Minus:
    return integral ? checkedSub(a.i, b.i) : fromDouble(a.asDouble() - b.asDouble());
  case TokenType::Star:
    return integral ? checkedMul(a.i, b.i) : fromDouble(a.asDouble() * b.asDouble());
  case TokenType::Slash:
    if (b.asDouble() == 0.0) {
      raise(location, "Division by zero");
    }
    if (integral && b.i == -1) {
      return checkedNegate(a.i);
    }
    if (integral && a.i % b.i == 0) {
      return Value(a.i / b.i);
    }
    return fromDouble(a.asDouble() / b.asDouble());
  case TokenType::Percent:
    if (b.asDouble() == 0.0) {
      raise(location, "Modulo by zero");
    }
    if (integral) {
      return Value(b.i == -1 ? i64{0} : a.i % b.i);
    }
    return fromDouble(std::fmod(a.asDouble(), b.asDouble()));
  default:
    break;
  }
  raise(location, std::string("Unsupported operator ") + tokenTypeName(op));
}

Value binary(TokenType op, const Value& left, const Value& right, SourceLocation location) {
  switch (op) {
  case TokenType::Equal:
    return Value(valuesEqual(left, right));
  case TokenType::NotEqual:
    return Value(!valuesEqual(left, right));
  case TokenType::Less:
  case TokenType::LessEqual:
  case TokenType::Greater:
  case TokenType::GreaterEqual: {
    auto order = compareValues(left, right);
    if (!order) {
      return Value(false);
    }
    int c = *order;
    bool result = op == TokenType::Less        ? c < 0
                  : op == TokenType::LessEqual ? c <= 0
                  : op == TokenType::Greater   ? c > 0
                                               : c >= 0;
    return Value(result);
  }
  default:
    return arithmetic(op, left, right, location);
  }
}

std::optional<size_t> toArrayIndex(const Value& key) {
  if (key.is_number_integer() || key.is_number_unsigned()) {
    i64 i = key.get<i64>();
    if (i >= 0) {
      return static_cast<size_t>(i);
    }
    return std::nullopt;
  }
  if (key.is_number_float()) {
    f64 d = key.get<f64>();
    // 2^53 bounds the doubles that still hold exact integers
    if (d >= 0.0 && d <= 9007199254740992.0 && d == std::floor(d)) {
      return static_cast<size_t>(d);
    }
  }
  return std::nullopt;
}

struct PathSegment {
  bool isIndex = false;
  std::string key;
  size_t index = 0;
};

std::vector<PathSegment> resolvePath(const Expr& target, const Interpreter& reader) {
  std::vector<PathSegment> segments;
  const Expr* node = &target;

  while (node->kind != ExprKind::StateRoot) {
    PathSegment segment;
    if (node->kind == ExprKind::Member) {
      segment.key = node->name;
    } else {
      auto key = reader.evaluate(*node->other);
      if (key.isError()) {
        throw EvalFailure{key.error()};
      }
      const Value& k = key.value();
      if (k.is_string()) {
        segment.key = k.get<std::string>();
      } else if (auto index = toArrayIndex(k)) {
        segment.isIndex = true;
        segment.index = *index;
        segment.key = std::to_string(*index);
      } else {
        raise(node->location, std::string("Invalid index of type ") + typeName(k));
      }
    }
    segments.push_back(std::move(segment));
    node = node->object.get();
  }

  std::reverse(segments.begin(), segments.end());
  return segments;
}

Value& locate(Value& state, const std::vector<PathSegment>& segments, SourceLocation location) {
  Value* slot = &state;

  for (const auto& segment : segments) {
    if (slot->is_null() && !segment.isIndex) {
      *slot = Value::object();
    }

    if (slot->is_object()) {
      slot = &(*slot)[segment.key];
    } else if (slot->is_array() && segment.isIndex) {
      if (segment.index < slot->size()) {
        slot = &(*slot)[segment.index];
      } else if (segment.index == slot->size()) {
        slot->push_back(nullptr);
        slot = &slot->back();
      } else {
        raise(location, "Index " + segment.key + " is out of range");
      }
    } else {
      raise(location,
            "Cannot set '" + segment.key + "' on a value of type " + typeName(*slot));
    }
  }

  return *slot;
}

TokenType compoundOperator(TokenType op) {
  switch (op) {
  case TokenType::PlusAssign:
  case TokenType::PlusPlus:
    return TokenType::Plus;
  case TokenType::MinusAssign:
  case TokenType::MinusMinus:
    return TokenType::Minus;
  case TokenType::StarAssign:
    return TokenType::Star;
  case TokenType::SlashAssign:
    return TokenType::Slash;
  default:
    return TokenType::Error;
  }
}

} // namespace

Interpreter::Interpreter(const Value& state) : m_state(state) {}

Result<Value, ScriptError> Interpreter::evaluate(const Expr& expr) const {
  try {
    return Result<Value, ScriptError>::ok(eval(expr));
  } catch (const EvalFailure& failure) {
    return Result<Value, ScriptError>::error(failure.error);
  } catch (const nlohmann::json::exception& e) {
    return Result<Value, ScriptError>::error(
        ScriptError(ScriptErrorStage::Runtime, e.what(), expr.location));
  }
}

Value Interpreter::eval(const Expr& expr) const {
  switch (expr.kind) {
  case ExprKind::Literal:
    return expr.literal;
  case ExprKind::StateRoot:
    return m_state;
  case ExprKind::Member:
    return evalMember(expr);
  case ExprKind::Index:
    return evalIndex(expr);
  case ExprKind::Unary:
    return evalUnary(expr);
  case ExprKind::Binary:
    return evalBinary(expr);
  case ExprKind::Logical: {
    Value left = eval(*expr.object);
    if (expr.op == TokenType::PipePipe) {
      return isTruthy(left) ? left : eval(*expr.other);
    }
    return isTruthy(left) ? eval(*expr.other) : left;
  }
  case ExprKind::Call:
    return evalCall(expr);
  }
  raise(expr.location, "Unknown expression");
}

Value Interpreter::evalMember(const Expr& expr) const {
  // Reading straight off the root avoids copying the whole state mapping
  const Value* object = nullptr;
  Value holder;
  if (expr.object->kind == ExprKind::StateRoot) {
    object = &m_state;
  } else {
    holder = eval(*expr.object);
    object = &holder;
  }

  if (object->is_null()) {
    raise(expr.location, "Cannot read property '" + expr.name + "' of null");
  }

  if (object->is_object()) {
    auto it = object->find(expr.name);
    if (it != object->end()) {
      return *it;
    }
  }

  if (expr.name == "length") {
    if (object->is_string()) {
      return Value(object->get_ref<const std::string&>().size());
    }
    if (object->is_array() || object->is_object()) {
      return Value(object->size());
    }
  }

  return Value();
}

Value Interpreter::evalIndex(const Expr& expr) const {
  Value object = eval(*expr.object);
  Value key = eval(*expr.other);

  if (object.is_null()) {
    raise(expr.location, "Cannot index into null with " + toDisplayString(key));
  }

  if (object.is_array()) {
    if (auto index = toArrayIndex(key); index && *index < object.size()) {
      return object[*index];
    }
    return Value();
  }

  if (object.is_object()) {
    auto it = object.find(toDisplayString(key));
    return it != object.end() ? *it : Value();
  }

  if (object.is_string()) {
    const auto& text = object.get_ref<const std::string&>();
    if (auto index = toArrayIndex(key); index && *index < text.size()) {
      return Value(std::string(1, text[*index]));
    }
  }

  return Value();
}

Value Interpreter::evalUnary(const Expr& expr) const {
  Value operand = eval(*expr.object);

  if (expr.op == TokenType::Bang) {
    return Value(!isTruthy(operand));
  }

  Number n = requireNumber(operand, expr.op, expr.location);
  if (expr.op == TokenType::Minus) {
    return n.isInteger ? checkedNegate(n.i) : Value(-n.d);
  }
  return n.isInteger ? Value(n.i) : Value(n.d);
}

Value Interpreter::evalBinary(const Expr& expr) const {
  Value left = eval(*expr.object);
  Value right = eval(*expr.other);
  return binary(expr.op, left, right, expr.location);
}

Value Interpreter::evalCall(const Expr& expr) const {
  Value target = eval(*expr.object);

  if (expr.name != "includes" && expr.name != "startsWith" && expr.name != "endsWith") {
    raise(expr.location, "Unknown function '" + expr.name + "'");
  }
  if (expr.arguments.size() != 1) {
    raise(expr.location, "'" + expr.name + "' expects exactly one argument");
  }
  if (target.is_null()) {
    raise(expr.location, "Cannot call '" + expr.name + "' on null");
  }

  Value argument = eval(*expr.arguments.front());

  if (expr.name == "includes" && target.is_array()) {
    return Value(std::any_of(target.begin(), target.end(), [&argument](const Value& item) {
      return valuesEqual(item, argument);
    }));
  }

  if (!target.is_string()) {
    raise(expr.location, "'" + expr.name + "' cannot be called on " + typeName(target));
  }

  const auto& text = target.get_ref<const std::string&>();
  std::string needle = toDisplayString(argument);

  if (expr.name == "includes") {
    return Value(text.find(needle) != std::string::npos);
  }
  if (expr.name == "startsWith") {
    return Value(text.compare(0, needle.size(), needle) == 0);
  }
  return Value(text.size() >= needle.size() &&
               text.compare(text.size() - needle.size(), needle.size(), needle) == 0);
}

Result<void, ScriptError> Interpreter::execute(const Script& script, Value& state) {
  if (state.is_null()) {
    state = Value::object();
  }

  for (const auto& stmt : script.statements) {
    try {
      Interpreter reader(state);
      Value rhs;
      if (stmt.value) {
        rhs = reader.eval(*stmt.value);
      } else {
        rhs = Value(1);
      }

      auto segments = resolvePath(*stmt.target, reader);
      Value& slot = locate(state, segments, stmt.location);

      if (stmt.op == TokenType::Assign) {
        slot = std::move(rhs);
      } else {
        slot = binary(compoundOperator(stmt.op), slot, rhs, stmt.location);
      }
    } catch (const EvalFailure& failure) {
      return Result<void, ScriptError>::error(failure.error);
    } catch (const nlohmann::json::exception& e) {
      return Result<void, ScriptError>::error(
          ScriptError(ScriptErrorStage::Runtime, e.what(), stmt.location));
    }
  }

  return Result<void, ScriptError>::ok();
}

Result<CompiledExpression, ScriptError> CompiledExpression::compile(std::string_view source) {
  Lexer lexer;
  auto tokens = lexer.tokenize(source);
  if (tokens.isError()) {
    return Result<CompiledExpression, ScriptError>::error(tokens.error());
  }

  Parser parser;
  auto expr = parser.parseExpression(tokens.value());
  if (expr.isError()) {
    return Result<CompiledExpression, ScriptError>::error(expr.error());
  }

  CompiledExpression compiled;
  compiled.m_source = std::string(source);
  compiled.m_root = std::shared_ptr<const Expr>(std::move(expr).value());
  return Result<CompiledExpression, ScriptError>::ok(std::move(compiled));
}

Result<Value, ScriptError> CompiledExpression::evaluate(const Value& state) const {
  if (!m_root) {
    return Result<Value, ScriptError>::error(
        ScriptError(ScriptErrorStage::Runtime, "Expression was not compiled"));
  }
  Interpreter interpreter(state);
  return interpreter.evaluate(*m_root);
}

Result<bool, ScriptError> CompiledExpression::test(const Value& state) const {
  auto value = evaluate(state);
  if (value.isError()) {
    return Result<bool, ScriptError>::error(value.error());
  }
  return Result<bool, ScriptError>::ok(isTruthy(value.value()));
}

Result<CompiledScript, ScriptError> CompiledScript::compile(std::string_view source) {
  Lexer lexer;
  auto tokens = lexer.tokenize(source);
  if (tokens.isError()) {
    return Result<CompiledScript, ScriptError>::error(tokens.error());
  }

  Parser parser;
  auto script = parser.parseScript(tokens.value());
  if (script.isError()) {
    return Result<CompiledScript, ScriptError>::error(script.error());
  }

  CompiledScript compiled;
  compiled.m_source = std::string(source);
  compiled.m_script = std::make_shared<const Script>(std::move(script).value());
  return Result<CompiledScript, ScriptError>::ok(std::move(compiled));
}

Result<void, ScriptError> CompiledScript::execute(Value& state) const {
  if (!m_script) {
    return Result<void, ScriptError>::ok();
  }

  Value working = state;
  auto result = Interpreter::execute(*m_script, working);
  if (result.isOk()) {
    state = std::move(working);
  }
  return result;
}

} // namespace Narrata::scripting
