#pragma once

/**
 * @file game_session.hpp
 * @brief One play-through: story, characters, dialogue and saves wired together
 */

#include "Narrata/character/character_action_generator.hpp"
#include "Narrata/character/character_state_manager.hpp"
#include "Narrata/core/result.hpp"
#include "Narrata/dialogue/dialogue_director.hpp"
#include "Narrata/dialogue/presenters.hpp"
#include "Narrata/runtime/runtime_config.hpp"
#include "Narrata/save/save_data.hpp"
#include "Narrata/save/save_manager.hpp"
#include "Narrata/story/story_error.hpp"
#include "Narrata/story/story_manager.hpp"
#include <memory>
#include <string>

namespace Narrata::runtime {

class GameSession {
public:
  explicit GameSession(const RuntimeConfig& config = {});
  ~GameSession();

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  /**
   * @brief Load a story and register the characters its assets declare
   *
   * The file format follows the story.format setting when it is set,
   * otherwise the file extension.
   */
  Result<void, story::StoryError> loadStory(story::Story story);
  Result<void, story::StoryError> loadStoryFile(const std::string& path);

  Result<void, story::StoryError> start();

  /**
   * @brief Drain queued auto-progression
   * @return Number of transitions performed
   */
  size_t update();

  /**
   * @brief Snapshot the narrative position, characters and game state
   */
  [[nodiscard]] save::SaveData createSaveData(const std::string& name) const;

  /**
   * @brief Return to the position recorded in @p data
   *
   * The story resumes at the saved node with the saved history. Game
   * state and character states are then replaced by the saved values,
   * overriding whatever re-entering the node changed.
   */
  Result<void, story::StoryError> restoreFromSaveData(const save::SaveData& data);

  Result<void> saveToSlot(i32 slot, const std::string& name);
  Result<void> loadFromSlot(i32 slot);

  void setScreenshotProvider(dialogue::IScreenshotProvider* provider) {
    m_screenshotProvider = provider;
  }

  [[nodiscard]] story::StoryManager& getStoryManager() { return *m_story; }
  [[nodiscard]] const story::StoryManager& getStoryManager() const { return *m_story; }
  [[nodiscard]] character::CharacterStateManager& getCharacterStates() { return *m_characters; }
  [[nodiscard]] character::CharacterActionGenerator& getActionGenerator() { return *m_generator; }
  [[nodiscard]] dialogue::DialogueDirector& getDirector() { return *m_director; }
  [[nodiscard]] save::SaveManager& getSaveManager() { return *m_saves; }
  [[nodiscard]] const RuntimeConfig& getConfig() const { return m_config; }

  /**
   * @brief Log unreachable nodes, auto-progress cycles and script errors
   */
  void reportDiagnostics() const;

private:
  void onStoryInstalled();
  void registerStoryCharacters();

  RuntimeConfig m_config;

  // Declaration order matters: the director detaches from the story on destruction
  std::unique_ptr<story::StoryManager> m_story;
  std::unique_ptr<character::CharacterStateManager> m_characters;
  std::unique_ptr<character::CharacterActionGenerator> m_generator;
  std::unique_ptr<dialogue::DialogueDirector> m_director;
  std::unique_ptr<save::SaveManager> m_saves;

  dialogue::IScreenshotProvider* m_screenshotProvider = nullptr;
};

} // namespace Narrata::runtime
