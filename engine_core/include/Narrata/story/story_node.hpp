#pragma once

/**
 * @file story_node.hpp
 * @brief Runtime wrapper around one story document node
 *
 * Conditions and hooks are compiled once when the node is created.
 * Evaluation never throws: a condition that fails to compile or evaluate
 * is false, and a failing hook leaves the state untouched. Both are
 * logged.
 */

#include "Narrata/scripting/interpreter.hpp"
#include "Narrata/scripting/value.hpp"
#include "Narrata/story/story_data.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Narrata::story {

using GameState = scripting::Value;

class StoryNode {
public:
  explicit StoryNode(StoryNodeData data);

  [[nodiscard]] const std::string& getId() const { return m_data.id; }
  [[nodiscard]] NodeType getType() const { return m_data.type; }
  [[nodiscard]] const StoryNodeData& getData() const { return m_data; }

  [[nodiscard]] const std::optional<std::string>& getText() const { return m_data.text; }
  [[nodiscard]] const std::optional<std::string>& getCharacterId() const {
    return m_data.character;
  }
  [[nodiscard]] const std::optional<std::string>& getMood() const { return m_data.mood; }
  [[nodiscard]] const std::optional<std::string>& getNextNodeId() const {
    return m_data.nextNode;
  }

  /**
   * @brief Scene id, only for scene nodes
   */
  [[nodiscard]] std::optional<std::string> getSceneId() const;

  [[nodiscard]] const std::vector<StoryChoice>& getChoices() const { return m_data.choices; }
  [[nodiscard]] const std::optional<std::vector<SceneCharacter>>& getCharacters() const {
    return m_data.characters;
  }
  [[nodiscard]] const std::vector<StoryAnimation>& getAnimations() const {
    return m_data.animations;
  }
  [[nodiscard]] const std::optional<StoryAudio>& getAudio() const { return m_data.audio; }
  [[nodiscard]] const GameState& getStateChanges() const { return m_data.stateChanges; }
  [[nodiscard]] const std::optional<NodeMetadata>& getMetadata() const {
    return m_data.metadata;
  }
  [[nodiscard]] const std::optional<DialogueOptions>& getDialogueOptions() const {
    return m_data.dialogueOptions;
  }
  [[nodiscard]] const std::vector<std::string>& getTags() const { return m_data.tags; }

  [[nodiscard]] std::optional<std::string> getBackground() const;
  [[nodiscard]] std::optional<std::string> getBackgroundTransitionType() const;

  /**
   * @brief metadata.transition (string or object type), or "default"
   */
  [[nodiscard]] std::string getTransitionType() const;

  /**
   * @brief Evaluate the node's condition; a node without one passes
   */
  [[nodiscard]] bool evaluateCondition(const GameState& state) const;

  /**
   * @brief Evaluate the condition of one of this node's choices
   */
  [[nodiscard]] bool evaluateChoiceCondition(size_t choiceIndex, const GameState& state) const;

  /**
   * @brief Run the onEnter hook against @p state
   * @return false if the hook failed and the state was left unchanged
   */
  bool executeOnEnter(GameState& state) const;
  bool executeOnExit(GameState& state) const;

  /**
   * @brief Choices whose condition is absent or true, in declaration order
   */
  [[nodiscard]] std::vector<StoryChoice> getAvailableChoices(const GameState& state) const;

private:
  struct CompiledCondition {
    bool present = false;
    scripting::CompiledExpression expression;
    std::optional<scripting::ScriptError> compileError;
  };

  struct CompiledHook {
    bool present = false;
    scripting::CompiledScript script;
    std::optional<scripting::ScriptError> compileError;
  };

  static CompiledCondition compileCondition(const std::optional<std::string>& source);
  static CompiledHook compileHook(const std::optional<std::string>& source);

  bool test(const CompiledCondition& condition, const GameState& state,
            const std::string& what) const;
  bool run(const CompiledHook& hook, GameState& state, const char* what) const;

  StoryNodeData m_data;
  CompiledCondition m_condition;
  std::vector<CompiledCondition> m_choiceConditions;
  CompiledHook m_onEnter;
  CompiledHook m_onExit;
};

} // namespace Narrata::story
