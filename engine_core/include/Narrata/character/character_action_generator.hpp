#pragma once

/**
 * @file character_action_generator.hpp
 * @brief Derives character presentation actions from story nodes
 *
 * The generator never mutates character state; callers apply the
 * returned actions (see CharacterStateManager::applyActions).
 */

#include "Narrata/character/character_state_manager.hpp"
#include "Narrata/character/character_types.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Narrata::story {
class StoryNode;
}

namespace Narrata::character {

struct ActionGeneratorConfig {
  f64 enterDuration = 0.8;
  f64 exitDuration = 0.7;
  f64 moveDuration = 0.5;
  // Chance of an emote after a line that gives no other reason for one
  f64 emoteBaseline = 0.3;
  // 0 seeds from std::random_device
  u32 randomSeed = 0;
};

class CharacterActionGenerator {
public:
  // Returns a value in [0, 1)
  using RandomSource = std::function<f64()>;

  static constexpr usize MaxRecentNodes = 5;

  CharacterActionGenerator();
  explicit CharacterActionGenerator(const ActionGeneratorConfig& config);
  ~CharacterActionGenerator();

  /**
   * @brief Replace the random source used by the emote and side heuristics
   *
   * Passing an empty function restores the seeded default.
   */
  void setRandomSource(RandomSource source);

  [[nodiscard]] const ActionGeneratorConfig& getConfig() const { return m_config; }

  /**
   * @brief Compute the actions that bring the stage in line with @p node
   *
   * Scene nodes produce exits for visible characters the scene does not
   * list, followed by entrances, moves and expression changes for the
   * listed ones. Dialogue nodes bring the speaker in, adjust the emotion
   * and speak. Node animations aimed at known characters are appended.
   *
   * Only characters present in @p characters are addressed.
   */
  [[nodiscard]] CharacterActionList generateActionsFromNode(const story::StoryNode& node,
                                                            const CharacterStateMap& characters);

  /**
   * @brief Actions smoothing a change of speaker between two nodes
   *
   * When the speaker changes, an invisible incoming speaker enters on
   * the side opposite the outgoing one and the outgoing speaker looks at
   * the incoming one if both are visible at different positions.
   */
  [[nodiscard]] CharacterActionList
  generateContextualActions(const story::StoryNode& currentNode, const story::StoryNode* nextNode,
                            const CharacterStateMap& characters);

  /**
   * @brief Forget the scene and recent-node tracking
   */
  void reset();

  [[nodiscard]] const std::optional<std::string>& getCurrentSceneId() const {
    return m_currentSceneId;
  }

  /**
   * @brief Ids of the most recently processed nodes, newest first
   */
  [[nodiscard]] std::vector<std::string> getRecentNodeIds() const;

private:
  void generateExits(const story::StoryNode& node, const CharacterStateMap& characters,
                     CharacterActionList& actions) const;
  void generateEntrances(const story::StoryNode& node, const CharacterStateMap& characters,
                         CharacterActionList& actions) const;
  void generateDialogueActions(const story::StoryNode& node, const CharacterStateMap& characters,
                               CharacterActionList& actions);

  [[nodiscard]] static CharacterEmotion determineEmotion(const std::optional<std::string>& mood,
                                                         const CharacterState& state);
  [[nodiscard]] bool shouldEmoteAfterSpeaking(const std::string& text,
                                              const std::optional<std::string>& mood);
  [[nodiscard]] static f64 determineEmoteIntensity(const std::string& text,
                                                   const std::optional<std::string>& mood);
  [[nodiscard]] CharacterPosition determineEnterPosition(CharacterPosition speakerPosition);

  f64 nextRandom();

  ActionGeneratorConfig m_config;
  std::mt19937 m_engine;
  RandomSource m_random;

  std::optional<std::string> m_currentSceneId;
  std::deque<std::string> m_recentNodeIds;
};

} // namespace Narrata::character
