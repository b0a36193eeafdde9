#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "Narrata/scripting/interpreter.hpp"
#include <cstdint>
#include <limits>

using namespace Narrata::scripting;

namespace {

Value eval(const std::string& source, const Value& state) {
  auto compiled = CompiledExpression::compile(source);
  REQUIRE(compiled.isOk());
  auto result = compiled.value().evaluate(state);
  REQUIRE(result.isOk());
  return result.value();
}

bool test(const std::string& source, const Value& state) {
  auto compiled = CompiledExpression::compile(source);
  REQUIRE(compiled.isOk());
  auto result = compiled.value().test(state);
  REQUIRE(result.isOk());
  return result.value();
}

} // namespace

TEST_CASE("Interpreter evaluates conditions against game state", "[interpreter]") {
  Value state = {{"trust", 3},
                 {"lampLit", false},
                 {"name", "Mara"},
                 {"inventory", {"rope", "lamp"}},
                 {"flags", {{"metTom", true}}}};

  SECTION("comparisons") {
    REQUIRE(test("trust >= 2", state));
    REQUIRE_FALSE(test("trust > 3", state));
    REQUIRE(test("name == 'Mara'", state));
    REQUIRE(test("name !== 'Tom'", state));
  }

  SECTION("logical operators short-circuit") {
    REQUIRE(test("flags.metTom && !lampLit", state));
    REQUIRE(test("lampLit || trust", state));
    REQUIRE(test("lampLit or missing == null", state));
    // The right side would fail if it were evaluated
    REQUIRE_FALSE(test("lampLit && missing.deep", state));
  }

  SECTION("missing keys read as null") {
    REQUIRE(eval("unknown", state).is_null());
    REQUIRE(test("!unknown", state));
  }

  SECTION("reading through null fails") {
    auto compiled = CompiledExpression::compile("missing.deep");
    REQUIRE(compiled.isOk());
    auto result = compiled.value().evaluate(state);
    REQUIRE(result.isError());
    REQUIRE(result.error().stage == ScriptErrorStage::Runtime);
  }

  SECTION("arrays and strings") {
    REQUIRE(test("inventory.includes('lamp')", state));
    REQUIRE_FALSE(test("inventory.includes('key')", state));
    REQUIRE(test("inventory[1] == 'lamp'", state));
    REQUIRE(eval("inventory.length", state) == 2);
    REQUIRE(test("name.startsWith('Ma') && name.endsWith('ra')", state));
    REQUIRE(test("name.includes('ar')", state));
  }

  SECTION("unknown functions are runtime errors") {
    auto compiled = CompiledExpression::compile("name.toUpperCase()");
    REQUIRE(compiled.isOk());
    REQUIRE(compiled.value().evaluate(state).isError());
  }
}

TEST_CASE("Interpreter arithmetic", "[interpreter]") {
  Value state = {{"gold", 7}, {"ratio", 0.5}};

  SECTION("integer arithmetic stays integral") {
    Value result = eval("gold * 2 - 4", state);
    REQUIRE(result.is_number_integer());
    REQUIRE(result == 10);
    REQUIRE(eval("gold % 4", state) == 3);
  }

  SECTION("uneven division yields a decimal") {
    REQUIRE(eval("gold / 2", state).get<double>() == Catch::Approx(3.5));
    REQUIRE(eval("gold / 7", state).is_number_integer());
  }

  SECTION("mixing decimals") {
    REQUIRE(eval("gold * ratio", state).get<double>() == Catch::Approx(3.5));
  }

  SECTION("string concatenation") {
    REQUIRE(eval("'gold: ' + gold", state) == "gold: 7");
  }

  SECTION("null counts as zero") {
    REQUIRE(eval("missing + 1", state) == 1);
  }

  SECTION("division by zero is an error") {
    auto compiled = CompiledExpression::compile("gold / 0");
    REQUIRE(compiled.isOk());
    auto result = compiled.value().evaluate(state);
    REQUIRE(result.isError());
    REQUIRE(result.error().message == "Division by zero");
  }

  SECTION("ordering unrelated types is false") {
    REQUIRE_FALSE(test("gold < 'ten'", state));
    REQUIRE_FALSE(test("gold >= 'ten'", state));
  }
}

TEST_CASE("Interpreter integer arithmetic at the edges of the range", "[interpreter]") {
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  Value state = {{"low", kMin}, {"high", kMax}, {"big", std::int64_t{1} << 62}};

  SECTION("dividing the smallest integer by -1 does not trap") {
    Value quotient = eval("low / -1", state);
    REQUIRE(quotient.is_number_float());
    REQUIRE(quotient.get<double>() == Catch::Approx(9.223372036854775808e18));
    REQUIRE(eval("low % -1", state) == 0);
    REQUIRE(eval("(-9223372036854775807 - 1) % -1", Value::object()) == 0);
  }

  SECTION("results outside the integer range continue as decimals") {
    Value sum = eval("high + 1", state);
    REQUIRE(sum.is_number_float());
    REQUIRE(sum.get<double>() == Catch::Approx(9.223372036854775808e18));

    Value difference = eval("low - 1", state);
    REQUIRE(difference.is_number_float());
    REQUIRE(difference.get<double>() < 0.0);

    Value negated = eval("-low", state);
    REQUIRE(negated.is_number_float());
    REQUIRE(negated.get<double>() > 0.0);

    REQUIRE(eval("high - 1", state) == kMax - 1);
    REQUIRE(eval("-high", state) == -kMax);
  }

  SECTION("multiplication that overflows is widened") {
    auto script = CompiledScript::compile("big = big * 4");
    REQUIRE(script.isOk());
    REQUIRE(script.value().execute(state).isOk());
    REQUIRE(state["big"].is_number_float());
    REQUIRE(state["big"].get<double>() == Catch::Approx(1.8446744073709552e19));

    REQUIRE(eval("low * -1", state).is_number_float());
    REQUIRE(eval("-3 * 4", Value::object()) == -12);
  }

  SECTION("huge decimal indexes are rejected rather than cast") {
    Value items = {{"items", {"rope", "lamp"}}, {"far", 1e300}};
    REQUIRE(eval("items[far]", items).is_null());

    auto script = CompiledScript::compile("items[far] = 'oil'");
    REQUIRE(script.isOk());
    auto result = script.value().execute(items);
    REQUIRE(result.isError());
    REQUIRE(items["items"].size() == 2);
  }
}

TEST_CASE("Value helpers", "[interpreter][value]") {
  SECTION("truthiness") {
    REQUIRE_FALSE(isTruthy(Value()));
    REQUIRE_FALSE(isTruthy(Value(0)));
    REQUIRE_FALSE(isTruthy(Value("")));
    REQUIRE_FALSE(isTruthy(Value(false)));
    REQUIRE(isTruthy(Value(0.1)));
    REQUIRE(isTruthy(Value("x")));
    REQUIRE(isTruthy(Value::array()));
  }

  SECTION("numeric equality across representations") {
    REQUIRE(valuesEqual(Value(2), Value(2.0)));
    REQUIRE_FALSE(valuesEqual(Value(2), Value("2")));
  }

  SECTION("comparison") {
    REQUIRE(compareValues(Value(1), Value(2)).value() < 0);
    REQUIRE(compareValues(Value("b"), Value("a")).value() > 0);
    REQUIRE_FALSE(compareValues(Value(1), Value("a")).has_value());
  }
}

TEST_CASE("CompiledScript applies hook statements", "[interpreter][script]") {
  SECTION("assignments and compound operators") {
    auto script = CompiledScript::compile("visited = true; trust += 2; count++; gold -= 1");
    REQUIRE(script.isOk());
    REQUIRE(script.value().statementCount() == 4);

    Value state = {{"trust", 1}, {"gold", 5}};
    REQUIRE(script.value().execute(state).isOk());
    REQUIRE(state["visited"] == true);
    REQUIRE(state["trust"] == 3);
    REQUIRE(state["count"] == 1);
    REQUIRE(state["gold"] == 4);
  }

  SECTION("nested paths are created on demand") {
    auto script = CompiledScript::compile("relationships.mara.trust = 5");
    REQUIRE(script.isOk());

    Value state = Value::object();
    REQUIRE(script.value().execute(state).isOk());
    REQUIRE(state["relationships"]["mara"]["trust"] == 5);
  }

  SECTION("arrays can be appended by index") {
    auto script = CompiledScript::compile("items[2] = 'oil'");
    REQUIRE(script.isOk());

    Value state = {{"items", {"rope", "lamp"}}};
    REQUIRE(script.value().execute(state).isOk());
    REQUIRE(state["items"].size() == 3);
    REQUIRE(state["items"][2] == "oil");
  }

  SECTION("a failing statement leaves the state untouched") {
    auto script = CompiledScript::compile("trust = 10; name.first = 'x'");
    REQUIRE(script.isOk());

    Value state = {{"trust", 1}, {"name", "Mara"}};
    auto result = script.value().execute(state);
    REQUIRE(result.isError());
    REQUIRE(state["trust"] == 1);
  }

  SECTION("syntax errors are reported with a location") {
    auto script = CompiledScript::compile("trust += ");
    REQUIRE(script.isError());
    REQUIRE(script.error().format().find("1:") != std::string::npos);
  }
}
