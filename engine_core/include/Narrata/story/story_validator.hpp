#pragma once

#include "Narrata/core/result.hpp"
#include "Narrata/story/story_data.hpp"
#include "Narrata/story/story_error.hpp"
#include <string>
#include <vector>

namespace Narrata::story {

/**
 * @brief A non-fatal finding about a story, reported by the diagnostics
 */
struct StoryDiagnostic {
  std::string nodeId;
  std::string field;
  std::string message;
};

/**
 * @brief Structural and referential checks over a typed Story
 *
 * validate() is total: a Story it accepts can be traversed without any
 * further reference checks. The find* functions are diagnostics that
 * never reject a story.
 */
class StoryValidator {
public:
  /**
   * @brief Reject the first structural problem found
   *
   * Checks required story fields, that startNode and every nextNode and
   * choice target name an existing node, the fields each node type
   * requires, and that end nodes declare no nextNode.
   */
  [[nodiscard]] static Result<void, StoryError> validate(const Story& story);

  /**
   * @brief Nodes not reachable from startNode via nextNode or choice targets
   */
  [[nodiscard]] static std::vector<std::string> findUnreachableNodes(const Story& story);

  /**
   * @brief Cycles made only of scene and branch nodes linked by nextNode
   *
   * These may auto-progress forever when their conditions hold. Each
   * entry is one strongly connected group, ids sorted.
   */
  [[nodiscard]] static std::vector<std::vector<std::string>>
  findAutoProgressCycles(const Story& story);

  /**
   * @brief Conditions, choice conditions and hooks that fail to compile
   */
  [[nodiscard]] static std::vector<StoryDiagnostic> findScriptErrors(const Story& story);
};

} // namespace Narrata::story
