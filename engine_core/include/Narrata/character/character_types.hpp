#pragma once

/**
 * @file character_types.hpp
 * @brief Live character state and the actions that drive its presentation
 */

#include "Narrata/core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Narrata::character {

enum class CharacterPosition { Left, Center, Right, OffScreenLeft, OffScreenRight };

enum class CharacterEmotion {
  Neutral,
  Happy,
  Sad,
  Angry,
  Surprised,
  Thoughtful,
  Worried,
  Excited,
  Determined,
  Powerful,
  Ethereal
};

// Animation names understood by the presenters; nodes may name others
namespace animation {
inline constexpr const char* Idle = "idle";
inline constexpr const char* Talk = "talk";
inline constexpr const char* WalkIn = "walkIn";
inline constexpr const char* WalkOut = "walkOut";
inline constexpr const char* Emote = "emote";
inline constexpr const char* LookAt = "lookAt";
} // namespace animation

[[nodiscard]] const char* positionName(CharacterPosition position);

/**
 * @brief Parse a position name
 *
 * Case-insensitive; '-' and '_' are ignored, so "offScreenLeft",
 * "off-screen-left" and "OFFSCREEN_LEFT" all name the same position.
 */
[[nodiscard]] std::optional<CharacterPosition> parsePosition(std::string_view name);

[[nodiscard]] bool isOffScreen(CharacterPosition position);

[[nodiscard]] const char* emotionName(CharacterEmotion emotion);

/**
 * @brief Parse one of the canonical emotion names, case-insensitively
 */
[[nodiscard]] std::optional<CharacterEmotion> parseEmotion(std::string_view name);

/**
 * @brief Map a free-form mood word onto an emotion
 *
 * Synonyms collapse onto one emotion ("joyful", "cheerful" -> Happy).
 * Unrecognised moods are Neutral.
 */
[[nodiscard]] CharacterEmotion emotionFromMood(std::string_view mood);

struct CharacterState {
  std::string id;
  CharacterPosition position = CharacterPosition::OffScreenLeft;
  CharacterEmotion currentEmotion = CharacterEmotion::Neutral;
  std::optional<std::string> currentAnimation;
  bool isVisible = false;
  nlohmann::json customState = nlohmann::json::object();

  bool operator==(const CharacterState& other) const = default;
};

/**
 * @brief Fields to overwrite in a CharacterState; unset fields are kept
 */
struct CharacterStatePatch {
  std::optional<CharacterPosition> position;
  std::optional<CharacterEmotion> currentEmotion;
  std::optional<std::string> currentAnimation;
  std::optional<bool> isVisible;
  std::optional<nlohmann::json> customState;

  [[nodiscard]] bool empty() const {
    return !position && !currentEmotion && !currentAnimation && !isVisible && !customState;
  }
  void applyTo(CharacterState& state) const;
};

enum class CharacterActionType { Enter, Exit, Move, ChangeEmotion, Animate, Speak };

[[nodiscard]] const char* actionTypeName(CharacterActionType type);

struct CharacterAction {
  CharacterActionType type = CharacterActionType::Animate;
  std::string characterId;
  std::optional<CharacterPosition> position;
  std::optional<CharacterEmotion> emotion;
  std::optional<std::string> animation;
  std::optional<f64> duration;
  std::optional<std::string> text;
  std::optional<std::string> audioId;
  nlohmann::json customParams = nlohmann::json::object();
};

using CharacterActionList = std::vector<CharacterAction>;

void to_json(nlohmann::json& j, const CharacterState& state);
void from_json(const nlohmann::json& j, CharacterState& state);

} // namespace Narrata::character
