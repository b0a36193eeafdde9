#pragma once

/**
 * @file presenters.hpp
 * @brief Presentation interfaces driven by the dialogue layer
 *
 * The engine core never renders anything itself. A front end implements
 * these interfaces (a console in narrata_player, sprites and text boxes
 * elsewhere) and hands them to DialogueDirector and GameSession.
 */

#include "Narrata/character/character_types.hpp"
#include "Narrata/core/types.hpp"
#include "Narrata/story/story_data.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Narrata::dialogue {

/**
 * @brief Display settings registered per speaking character
 */
struct CharacterDefinition {
  std::string name;
  std::optional<std::string> displayName;
  std::optional<std::string> textColor;
  std::optional<f64> textSpeed;
  std::optional<std::string> animationIn;
  std::optional<std::string> animationOut;
};

/**
 * @brief One line of text ready for display
 */
struct DialogueLine {
  std::string nodeId;
  std::optional<std::string> speakerId;
  std::optional<std::string> displayName;
  std::string text;
  std::optional<character::CharacterEmotion> emotion;
  std::optional<f64> textSpeed;
  std::optional<std::string> textColor;
  std::optional<story::TextEffect> textEffect;
  std::string animationIn;
  std::string animationOut;
};

class ICharacterPresenter {
public:
  virtual ~ICharacterPresenter() = default;

  virtual void executeAction(const character::CharacterAction& action) = 0;
};

class IDialoguePresenter {
public:
  virtual ~IDialoguePresenter() = default;

  /**
   * @brief Start showing @p line
   *
   * The presenter reports the end of text reveal through
   * DialogueDirector::onTypingComplete().
   */
  virtual void showDialogue(const DialogueLine& line) = 0;
  virtual void showChoices(const std::vector<story::StoryChoice>& choices,
                           const std::string& animation) = 0;
  virtual void hideDialogue() = 0;
  virtual void changeBackground(const std::string& backgroundId) = 0;
  virtual void playSceneEffect(const story::EffectHint& effect) = 0;
};

/**
 * @brief Source of save-slot thumbnails
 */
class IScreenshotProvider {
public:
  virtual ~IScreenshotProvider() = default;

  /**
   * @return Encoded thumbnail, or std::nullopt when none is available
   */
  [[nodiscard]] virtual std::optional<std::string> captureThumbnail() = 0;
};

} // namespace Narrata::dialogue
