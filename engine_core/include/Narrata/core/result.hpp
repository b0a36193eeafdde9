#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used by every fallible engine operation
 *
 * Engine code reports recoverable failures through Result instead of
 * throwing across module boundaries. The error type defaults to a plain
 * message string; subsystems with a richer taxonomy (story loading and
 * traversal) supply their own error struct.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace Narrata {

template <typename T, typename E = std::string> class Result {
public:
  static Result ok(T value) { return Result(std::move(value), Tag{}); }

  static Result error(E err) {
    Result result;
    result.m_error = std::move(err);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }
  explicit operator bool() const { return isOk(); }

  [[nodiscard]] T& value() & {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    if (!m_value) {
      throw std::logic_error("Result::value() called on an error result");
    }
    return std::move(*m_value);
  }

  [[nodiscard]] const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on a successful result");
    }
    return *m_error;
  }

  [[nodiscard]] T valueOr(T fallback) const {
    return m_value ? *m_value : std::move(fallback);
  }

private:
  struct Tag {};

  Result() = default;
  Result(T value, Tag) : m_value(std::move(value)) {}

  std::optional<T> m_value;
  std::optional<E> m_error;
};

template <typename E> class Result<void, E> {
public:
  static Result ok() { return Result(); }

  static Result error(E err) {
    Result result;
    result.m_error = std::move(err);
    return result;
  }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }
  explicit operator bool() const { return isOk(); }

  [[nodiscard]] const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on a successful result");
    }
    return *m_error;
  }

private:
  Result() = default;

  std::optional<E> m_error;
};

} // namespace Narrata
