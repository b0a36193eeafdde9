#pragma once

/**
 * @file dialogue_director.hpp
 * @brief Turns story transitions into dialogue and character presentation
 *
 * DialogueDirector listens to a StoryManager. For every entered node it
 * derives character actions, applies them to the CharacterStateManager
 * and forwards them to the character presenter, then shows the node's
 * text, choices, background and effects through the dialogue presenter.
 *
 * On a choice node with text the choices are revealed only after the
 * presenter reports onTypingComplete() or the player continues.
 */

#include "Narrata/character/character_action_generator.hpp"
#include "Narrata/character/character_state_manager.hpp"
#include "Narrata/core/result.hpp"
#include "Narrata/dialogue/presenters.hpp"
#include "Narrata/story/story_error.hpp"
#include "Narrata/story/story_manager.hpp"
#include <map>
#include <string>
#include <vector>

namespace Narrata::dialogue {

/**
 * @brief Receives dialogue-level notifications; methods default to no-ops
 */
class IDialogueListener {
public:
  virtual ~IDialogueListener() = default;

  virtual void onDialogueStarted(const DialogueLine& /*line*/) {}
  virtual void onChoicesShown(const std::vector<story::StoryChoice>& /*choices*/) {}
  virtual void onDialogueEnded(const std::string& /*nodeId*/) {}
  virtual void onStoryEnded() {}
};

class DialogueDirector : public story::IStoryListener {
public:
  static constexpr const char* DefaultAnimationIn = "fadeIn";
  static constexpr const char* DefaultAnimationOut = "fadeOut";
  static constexpr const char* DefaultChoiceAnimation = "stagger";

  /**
   * @brief Attach to @p story; detaches again on destruction
   */
  DialogueDirector(story::StoryManager& story, character::CharacterStateManager& characters,
                   character::CharacterActionGenerator& generator);
  ~DialogueDirector() override;

  DialogueDirector(const DialogueDirector&) = delete;
  DialogueDirector& operator=(const DialogueDirector&) = delete;

  void setCharacterPresenter(ICharacterPresenter* presenter) { m_characterPresenter = presenter; }
  void setDialoguePresenter(IDialoguePresenter* presenter) { m_dialoguePresenter = presenter; }

  /**
   * @brief Register display settings for a speaker and create its state
   */
  void registerCharacter(const std::string& id, CharacterDefinition definition);
  [[nodiscard]] const CharacterDefinition* getCharacterDefinition(const std::string& id) const;

  /**
   * @brief Player asked to continue past the current text
   *
   * On a choice node this reveals the choices. On a node with a next
   * node it progresses the story. Otherwise the dialogue ends.
   */
  Result<void, story::StoryError> continueDialogue();

  Result<void, story::StoryError> selectChoice(int index);

  /**
   * @brief The presenter finished revealing the current line
   */
  void onTypingComplete();

  void hideDialogue();

  [[nodiscard]] bool isActive() const { return m_active; }
  [[nodiscard]] bool isAwaitingChoice() const { return m_choicesShown; }

  void addListener(IDialogueListener* listener);
  void removeListener(IDialogueListener* listener);

  // IStoryListener
  void onStoryLoaded(const story::Story& story) override;
  void onStoryReset() override;
  void onNodeEntered(const story::StoryNode& current, const story::StoryNode* previous) override;

private:
  void applyActions(const character::CharacterActionList& actions);
  void showDialogue(const story::StoryNode& node);
  void showChoices(const story::StoryNode& node);
  [[nodiscard]] DialogueLine buildLine(const story::StoryNode& node) const;

  template <typename Fn> void notify(Fn&& fn);

  story::StoryManager& m_story;
  character::CharacterStateManager& m_characters;
  character::CharacterActionGenerator& m_generator;

  ICharacterPresenter* m_characterPresenter = nullptr;
  IDialoguePresenter* m_dialoguePresenter = nullptr;

  std::map<std::string, CharacterDefinition> m_definitions;
  std::vector<IDialogueListener*> m_listeners;

  bool m_active = false;
  bool m_choicesShown = false;
  // Choice node whose choices wait for the text to finish typing
  std::string m_pendingChoiceNode;
};

} // namespace Narrata::dialogue
