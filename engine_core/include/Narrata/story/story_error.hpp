#pragma once

/**
 * @file story_error.hpp
 * @brief Typed failures of story loading and traversal
 *
 * Load-time problems (FormatError, ValidationError) reject the document
 * before it is installed. The remaining codes are traversal contract
 * violations reported to the caller of StoryManager.
 */

#include <string>

namespace Narrata::story {

enum class StoryErrorCode {
  FormatError,
  ValidationError,
  NodeNotFound,
  InvalidChoice,
  CannotProgress,
  NotChoiceNode,
  NoStoryLoaded
};

enum class ProgressBlockReason { None, NoCurrentNode, IsChoiceNode, IsEndNode, NoNextNode };

[[nodiscard]] const char* storyErrorCodeName(StoryErrorCode code);
[[nodiscard]] const char* progressBlockReasonName(ProgressBlockReason reason);

struct StoryError {
  StoryErrorCode code = StoryErrorCode::ValidationError;
  std::string nodeId;
  std::string field;
  std::string message;
  ProgressBlockReason reason = ProgressBlockReason::None;

  StoryError() = default;
  StoryError(StoryErrorCode c, std::string msg, std::string node = {}, std::string fieldName = {})
      : code(c), nodeId(std::move(node)), field(std::move(fieldName)), message(std::move(msg)) {}

  static StoryError formatError(std::string msg) {
    return StoryError(StoryErrorCode::FormatError, std::move(msg));
  }

  static StoryError validation(std::string node, std::string fieldName, std::string msg) {
    return StoryError(StoryErrorCode::ValidationError, std::move(msg), std::move(node),
                      std::move(fieldName));
  }

  static StoryError cannotProgress(ProgressBlockReason why, std::string node) {
    StoryError err(StoryErrorCode::CannotProgress, progressBlockReasonName(why), std::move(node));
    err.reason = why;
    return err;
  }

  /**
   * @brief One line, e.g. "ValidationError [node 'intro', field 'nextNode']: ..."
   */
  [[nodiscard]] std::string format() const;
};

} // namespace Narrata::story
