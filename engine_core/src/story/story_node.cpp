#include "Narrata/story/story_node.hpp"
#include "Narrata/core/logger.hpp"
#include <exception>

namespace Narrata::story {

StoryNode::StoryNode(StoryNodeData data) : m_data(std::move(data)) {
  m_condition = compileCondition(m_data.condition);
  m_choiceConditions.reserve(m_data.choices.size());
  for (const auto& choice : m_data.choices) {
    m_choiceConditions.push_back(compileCondition(choice.condition));
  }
  m_onEnter = compileHook(m_data.onEnter);
  m_onExit = compileHook(m_data.onExit);
}

StoryNode::CompiledCondition
StoryNode::compileCondition(const std::optional<std::string>& source) {
  CompiledCondition compiled;
  if (!source) {
    return compiled;
  }
  compiled.present = true;
  auto result = scripting::CompiledExpression::compile(*source);
  if (result.isOk()) {
    compiled.expression = std::move(result).value();
  } else {
    compiled.compileError = result.error();
  }
  return compiled;
}

StoryNode::CompiledHook StoryNode::compileHook(const std::optional<std::string>& source) {
  CompiledHook compiled;
  if (!source) {
    return compiled;
  }
  compiled.present = true;
  auto result = scripting::CompiledScript::compile(*source);
  if (result.isOk()) {
    compiled.script = std::move(result).value();
  } else {
    compiled.compileError = result.error();
  }
  return compiled;
}

std::optional<std::string> StoryNode::getSceneId() const {
  if (m_data.type == NodeType::Scene) {
    return m_data.sceneId;
  }
  return std::nullopt;
}

std::optional<std::string> StoryNode::getBackground() const {
  if (m_data.background) {
    return m_data.background->id;
  }
  return std::nullopt;
}

std::optional<std::string> StoryNode::getBackgroundTransitionType() const {
  if (m_data.background) {
    return m_data.background->transition;
  }
  return std::nullopt;
}

std::string StoryNode::getTransitionType() const {
  if (m_data.metadata && m_data.metadata->transition &&
      !m_data.metadata->transition->type.empty()) {
    return m_data.metadata->transition->type;
  }
  return "default";
}

bool StoryNode::test(const CompiledCondition& condition, const GameState& state,
                     const std::string& what) const {
  if (!condition.present) {
    return true;
  }

  if (condition.compileError) {
    NARRATA_LOG_ERROR("Error evaluating {} for node '{}': {}", what, m_data.id,
                      condition.compileError->format());
    return false;
  }

  try {
    auto result = condition.expression.test(state);
    if (result.isError()) {
      NARRATA_LOG_ERROR("Error evaluating {} for node '{}': {}", what, m_data.id,
                        result.error().format());
      return false;
    }
    return result.value();
  } catch (const std::exception& e) {
    NARRATA_LOG_ERROR("Error evaluating {} for node '{}': {}", what, m_data.id, e.what());
    return false;
  }
}

bool StoryNode::run(const CompiledHook& hook, GameState& state, const char* what) const {
  if (!hook.present) {
    return true;
  }

  if (hook.compileError) {
    NARRATA_LOG_ERROR("Error executing {} script for node '{}': {}", what, m_data.id,
                      hook.compileError->format());
    return false;
  }

  try {
    auto result = hook.script.execute(state);
    if (result.isError()) {
      NARRATA_LOG_ERROR("Error executing {} script for node '{}': {}", what, m_data.id,
                        result.error().format());
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    NARRATA_LOG_ERROR("Error executing {} script for node '{}': {}", what, m_data.id, e.what());
    return false;
  }
}

bool StoryNode::evaluateCondition(const GameState& state) const {
  return test(m_condition, state, "condition");
}

bool StoryNode::evaluateChoiceCondition(size_t choiceIndex, const GameState& state) const {
  if (choiceIndex >= m_choiceConditions.size()) {
    return false;
  }
  return test(m_choiceConditions[choiceIndex], state,
              "condition of choice '" + m_data.choices[choiceIndex].id + "'");
}

bool StoryNode::executeOnEnter(GameState& state) const { return run(m_onEnter, state, "onEnter"); }

bool StoryNode::executeOnExit(GameState& state) const { return run(m_onExit, state, "onExit"); }

std::vector<StoryChoice> StoryNode::getAvailableChoices(const GameState& state) const {
  std::vector<StoryChoice> available;
  for (size_t i = 0; i < m_data.choices.size(); ++i) {
    if (evaluateChoiceCondition(i, state)) {
      available.push_back(m_data.choices[i]);
    }
  }
  return available;
}

} // namespace Narrata::story
