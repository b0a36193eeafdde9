#include "Narrata/story/story_error.hpp"

namespace Narrata::story {

const char* storyErrorCodeName(StoryErrorCode code) {
  switch (code) {
  case StoryErrorCode::FormatError:
    return "FormatError";
  case StoryErrorCode::ValidationError:
    return "ValidationError";
  case StoryErrorCode::NodeNotFound:
    return "NodeNotFound";
  case StoryErrorCode::InvalidChoice:
    return "InvalidChoice";
  case StoryErrorCode::CannotProgress:
    return "CannotProgress";
  case StoryErrorCode::NotChoiceNode:
    return "NotChoiceNode";
  case StoryErrorCode::NoStoryLoaded:
    return "NoStoryLoaded";
  }
  return "StoryError";
}

const char* progressBlockReasonName(ProgressBlockReason reason) {
  switch (reason) {
  case ProgressBlockReason::None:
    return "none";
  case ProgressBlockReason::NoCurrentNode:
    return "no current node";
  case ProgressBlockReason::IsChoiceNode:
    return "current node is a choice node, use makeChoice instead";
  case ProgressBlockReason::IsEndNode:
    return "current node is an end node";
  case ProgressBlockReason::NoNextNode:
    return "current node has no next node";
  }
  return "unknown";
}

std::string StoryError::format() const {
  std::string out = storyErrorCodeName(code);
  if (!nodeId.empty() || !field.empty()) {
    out += " [";
    if (!nodeId.empty()) {
      out += "node '" + nodeId + "'";
    }
    if (!field.empty()) {
      if (!nodeId.empty()) {
        out += ", ";
      }
      out += "field '" + field + "'";
    }
    out += "]";
  }
  out += ": " + message;
  return out;
}

} // namespace Narrata::story
