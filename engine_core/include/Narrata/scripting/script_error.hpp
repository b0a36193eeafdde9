#pragma once

/**
 * @file script_error.hpp
 * @brief Error reporting for story condition and hook scripts
 *
 * Lexer, parser and interpreter failures all surface as a ScriptError.
 * The story layer never propagates these to its callers; it logs the
 * formatted message and degrades (a failed condition is false, a failed
 * hook changes nothing).
 */

#include "Narrata/scripting/token.hpp"
#include <string>
#include <string_view>

namespace Narrata::scripting {

enum class ScriptErrorStage { Lexer, Parser, Runtime };

struct ScriptError {
  ScriptErrorStage stage = ScriptErrorStage::Runtime;
  std::string message;
  SourceLocation location;

  ScriptError() = default;
  ScriptError(ScriptErrorStage s, std::string msg, SourceLocation loc = {})
      : stage(s), message(std::move(msg)), location(loc) {}

  /**
   * @brief One-line description, e.g. "parse error at 1:12: Expected ')'"
   */
  [[nodiscard]] std::string format() const;

  /**
   * @brief format() followed by the offending source line and a caret
   *
   * @param source The script text the error was produced from
   */
  [[nodiscard]] std::string formatWithSource(std::string_view source) const;
};

} // namespace Narrata::scripting
