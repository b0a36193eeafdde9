#include "Narrata/story/story_validator.hpp"
#include "Narrata/scripting/interpreter.hpp"
#include <algorithm>
#include <functional>
#include <set>
#include <unordered_map>

namespace Narrata::story {

namespace {

using ValidationResult = Result<void, StoryError>;

ValidationResult fail(const std::string& nodeId, const std::string& field,
                      const std::string& message) {
  return ValidationResult::error(StoryError::validation(nodeId, field, message));
}

bool isAutoProgressing(const StoryNodeData& node) {
  return node.type == NodeType::Scene || node.type == NodeType::Branch;
}

bool missing(const std::optional<std::string>& value) { return !value || value->empty(); }

ValidationResult validateNode(const Story& story, const std::string& key,
                              const StoryNodeData& node) {
  if (node.id != key) {
    return fail(key, "id", "node id '" + node.id + "' does not match its key '" + key + "'");
  }

  switch (node.type) {
  case NodeType::Dialogue:
    if (missing(node.text)) {
      return fail(key, "text", "dialogue node must have text");
    }
    if (missing(node.character)) {
      return fail(key, "character", "dialogue node must have a character");
    }
    break;

  case NodeType::Choice:
    if (node.choices.empty()) {
      return fail(key, "choices", "choice node must have at least one choice");
    }
    for (size_t i = 0; i < node.choices.size(); ++i) {
      const auto& choice = node.choices[i];
      std::string field = "choices[" + std::to_string(i) + "]";
      if (choice.text.empty()) {
        return fail(key, field + ".text", "choice must have text");
      }
      if (choice.nextNode.empty()) {
        return fail(key, field + ".nextNode", "choice must have a nextNode");
      }
      if (!story.nodes.contains(choice.nextNode)) {
        return fail(key, field + ".nextNode",
                    "choice target '" + choice.nextNode + "' does not exist");
      }
    }
    break;

  case NodeType::Scene:
    if (missing(node.sceneId)) {
      return fail(key, "sceneId", "scene node must have a sceneId");
    }
    for (size_t i = 0; node.characters && i < node.characters->size(); ++i) {
      if ((*node.characters)[i].id.empty()) {
        return fail(key, "characters[" + std::to_string(i) + "].id",
                    "scene character must have an id");
      }
    }
    break;

  case NodeType::Branch:
    if (missing(node.condition)) {
      return fail(key, "condition", "branch node must have a condition");
    }
    if (missing(node.nextNode)) {
      return fail(key, "nextNode", "branch node must have a nextNode");
    }
    break;

  case NodeType::End:
    if (node.nextNode) {
      return fail(key, "nextNode", "end node must not declare a nextNode");
    }
    break;
  }

  if (node.nextNode && !story.nodes.contains(*node.nextNode)) {
    return fail(key, "nextNode", "next node '" + *node.nextNode + "' does not exist");
  }

  for (size_t i = 0; i < node.animations.size(); ++i) {
    const auto& animation = node.animations[i];
    std::string field = "animations[" + std::to_string(i) + "]";
    if (animation.target.empty()) {
      return fail(key, field + ".target", "animation must have a target");
    }
    if (animation.type.empty()) {
      return fail(key, field + ".type", "animation must have a type");
    }
  }

  if (!node.stateChanges.is_null() && !node.stateChanges.is_object()) {
    return fail(key, "stateChanges", "stateChanges must be a mapping");
  }

  return ValidationResult::ok();
}

} // namespace

Result<void, StoryError> StoryValidator::validate(const Story& story) {
  if (story.id.empty()) {
    return fail("", "id", "story must have an id");
  }
  if (story.title.empty()) {
    return fail("", "title", "story must have a title");
  }
  if (story.startNode.empty()) {
    return fail("", "startNode", "story must have a startNode");
  }
  if (story.nodes.empty()) {
    return fail("", "nodes", "story must have at least one node");
  }
  if (!story.nodes.contains(story.startNode)) {
    return fail(story.startNode, "startNode",
                "start node '" + story.startNode + "' does not exist in story nodes");
  }
  if (!story.initialState.is_object()) {
    return fail("", "initialState", "initialState must be a mapping");
  }

  for (const auto& [key, node] : story.nodes) {
    auto result = validateNode(story, key, node);
    if (result.isError()) {
      return result;
    }
  }

  return ValidationResult::ok();
}

std::vector<std::string> StoryValidator::findUnreachableNodes(const Story& story) {
  std::set<std::string> reachable;
  std::vector<std::string> pending;

  if (story.nodes.contains(story.startNode)) {
    pending.push_back(story.startNode);
  }

  while (!pending.empty()) {
    std::string id = std::move(pending.back());
    pending.pop_back();
    if (!reachable.insert(id).second) {
      continue;
    }

    auto it = story.nodes.find(id);
    if (it == story.nodes.end()) {
      continue;
    }
    const auto& node = it->second;
    if (node.nextNode) {
      pending.push_back(*node.nextNode);
    }
    for (const auto& choice : node.choices) {
      pending.push_back(choice.nextNode);
    }
  }

  std::vector<std::string> unreachable;
  for (const auto& [id, node] : story.nodes) {
    if (!reachable.contains(id)) {
      unreachable.push_back(id);
    }
  }
  return unreachable;
}

std::vector<std::vector<std::string>> StoryValidator::findAutoProgressCycles(const Story& story) {
  // Tarjan's strongly connected components over nextNode edges between
  // auto-progressing nodes
  struct Visit {
    int index = -1;
    int lowLink = 0;
    bool onStack = false;
  };

  std::unordered_map<std::string, Visit> visits;
  std::vector<std::string> stack;
  std::vector<std::vector<std::string>> cycles;
  int counter = 0;

  auto successor = [&story](const StoryNodeData& node) -> const StoryNodeData* {
    if (!isAutoProgressing(node) || !node.nextNode) {
      return nullptr;
    }
    auto it = story.nodes.find(*node.nextNode);
    if (it == story.nodes.end() || !isAutoProgressing(it->second)) {
      return nullptr;
    }
    return &it->second;
  };

  std::function<void(const StoryNodeData&)> connect = [&](const StoryNodeData& node) {
    Visit& visit = visits[node.id];
    visit.index = counter;
    visit.lowLink = counter;
    ++counter;
    visit.onStack = true;
    stack.push_back(node.id);

    if (const StoryNodeData* next = successor(node)) {
      auto found = visits.find(next->id);
      if (found == visits.end() || found->second.index < 0) {
        connect(*next);
        visits[node.id].lowLink = std::min(visits[node.id].lowLink, visits[next->id].lowLink);
      } else if (found->second.onStack) {
        visits[node.id].lowLink = std::min(visits[node.id].lowLink, found->second.index);
      }
    }

    Visit& self = visits[node.id];
    if (self.lowLink != self.index) {
      return;
    }

    std::vector<std::string> component;
    while (true) {
      std::string id = stack.back();
      stack.pop_back();
      visits[id].onStack = false;
      component.push_back(id);
      if (id == node.id) {
        break;
      }
    }

    const StoryNodeData* next = successor(node);
    bool selfLoop = next && next->id == node.id;
    if (component.size() > 1 || selfLoop) {
      std::sort(component.begin(), component.end());
      cycles.push_back(std::move(component));
    }
  };

  for (const auto& [id, node] : story.nodes) {
    if (isAutoProgressing(node) && !visits.contains(id)) {
      connect(node);
    }
  }

  return cycles;
}

std::vector<StoryDiagnostic> StoryValidator::findScriptErrors(const Story& story) {
  std::vector<StoryDiagnostic> diagnostics;

  auto checkExpression = [&diagnostics](const std::string& nodeId, const std::string& field,
                                        const std::optional<std::string>& source) {
    if (!source) {
      return;
    }
    auto compiled = scripting::CompiledExpression::compile(*source);
    if (compiled.isError()) {
      diagnostics.push_back({nodeId, field, compiled.error().format()});
    }
  };

  auto checkScript = [&diagnostics](const std::string& nodeId, const std::string& field,
                                    const std::optional<std::string>& source) {
    if (!source) {
      return;
    }
    auto compiled = scripting::CompiledScript::compile(*source);
    if (compiled.isError()) {
      diagnostics.push_back({nodeId, field, compiled.error().format()});
    }
  };

  for (const auto& [id, node] : story.nodes) {
    checkExpression(id, "condition", node.condition);
    for (size_t i = 0; i < node.choices.size(); ++i) {
      checkExpression(id, "choices[" + std::to_string(i) + "].condition",
                      node.choices[i].condition);
    }
    checkScript(id, "onEnter", node.onEnter);
    checkScript(id, "onExit", node.onExit);
  }

  return diagnostics;
}

} // namespace Narrata::story
