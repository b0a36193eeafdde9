#include "Narrata/scripting/value.hpp"
#include <cmath>

namespace Narrata::scripting {

bool isTruthy(const Value& value) {
  switch (value.type()) {
  case Value::value_t::null:
  case Value::value_t::discarded:
    return false;
  case Value::value_t::boolean:
    return value.get<bool>();
  case Value::value_t::number_integer:
    return value.get<i64>() != 0;
  case Value::value_t::number_unsigned:
    return value.get<u64>() != 0;
  case Value::value_t::number_float: {
    f64 d = value.get<f64>();
    return d != 0.0 && !std::isnan(d);
  }
  case Value::value_t::string:
    return !value.get_ref<const std::string&>().empty();
  default:
    return true;
  }
}

bool valuesEqual(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_number_float() || b.is_number_float()) {
      return a.get<f64>() == b.get<f64>();
    }
    return a == b;
  }
  return a == b;
}

std::optional<int> compareValues(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_number_float() || b.is_number_float()) {
      f64 x = a.get<f64>();
      f64 y = b.get<f64>();
      if (std::isnan(x) || std::isnan(y)) {
        return std::nullopt;
      }
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    i64 x = a.get<i64>();
    i64 y = b.get<i64>();
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  if (a.is_string() && b.is_string()) {
    int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

std::string toDisplayString(const Value& value) {
  switch (value.type()) {
  case Value::value_t::string:
    return value.get<std::string>();
  case Value::value_t::null:
  case Value::value_t::discarded:
    return "null";
  case Value::value_t::number_float: {
    f64 d = value.get<f64>();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
      return std::to_string(static_cast<i64>(d));
    }
    return value.dump();
  }
  default:
    return value.dump();
  }
}

} // namespace Narrata::scripting
