#include "Narrata/character/character_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Narrata::character {

namespace {

std::string normalize(std::string_view text, bool dropSeparators) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (dropSeparators && (c == '-' || c == '_' || c == ' ')) {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

constexpr CharacterEmotion kAllEmotions[] = {
    CharacterEmotion::Neutral,   CharacterEmotion::Happy,      CharacterEmotion::Sad,
    CharacterEmotion::Angry,     CharacterEmotion::Surprised,  CharacterEmotion::Thoughtful,
    CharacterEmotion::Worried,   CharacterEmotion::Excited,    CharacterEmotion::Determined,
    CharacterEmotion::Powerful,  CharacterEmotion::Ethereal};

} // namespace

const char* positionName(CharacterPosition position) {
  switch (position) {
  case CharacterPosition::Left:
    return "left";
  case CharacterPosition::Center:
    return "center";
  case CharacterPosition::Right:
    return "right";
  case CharacterPosition::OffScreenLeft:
    return "offScreenLeft";
  case CharacterPosition::OffScreenRight:
    return "offScreenRight";
  }
  return "center";
}

std::optional<CharacterPosition> parsePosition(std::string_view name) {
  std::string key = normalize(name, true);
  if (key == "left")
    return CharacterPosition::Left;
  if (key == "center" || key == "centre")
    return CharacterPosition::Center;
  if (key == "right")
    return CharacterPosition::Right;
  if (key == "offscreenleft")
    return CharacterPosition::OffScreenLeft;
  if (key == "offscreenright")
    return CharacterPosition::OffScreenRight;
  return std::nullopt;
}

bool isOffScreen(CharacterPosition position) {
  return position == CharacterPosition::OffScreenLeft ||
         position == CharacterPosition::OffScreenRight;
}

const char* emotionName(CharacterEmotion emotion) {
  switch (emotion) {
  case CharacterEmotion::Neutral:
    return "neutral";
  case CharacterEmotion::Happy:
    return "happy";
  case CharacterEmotion::Sad:
    return "sad";
  case CharacterEmotion::Angry:
    return "angry";
  case CharacterEmotion::Surprised:
    return "surprised";
  case CharacterEmotion::Thoughtful:
    return "thoughtful";
  case CharacterEmotion::Worried:
    return "worried";
  case CharacterEmotion::Excited:
    return "excited";
  case CharacterEmotion::Determined:
    return "determined";
  case CharacterEmotion::Powerful:
    return "powerful";
  case CharacterEmotion::Ethereal:
    return "ethereal";
  }
  return "neutral";
}

std::optional<CharacterEmotion> parseEmotion(std::string_view name) {
  std::string key = normalize(name, false);
  for (CharacterEmotion emotion : kAllEmotions) {
    if (key == emotionName(emotion)) {
      return emotion;
    }
  }
  return std::nullopt;
}

CharacterEmotion emotionFromMood(std::string_view mood) {
  std::string key = normalize(mood, false);

  if (key == "happy" || key == "joyful" || key == "cheerful")
    return CharacterEmotion::Happy;
  if (key == "sad" || key == "unhappy" || key == "depressed")
    return CharacterEmotion::Sad;
  if (key == "angry" || key == "mad" || key == "furious")
    return CharacterEmotion::Angry;
  if (key == "surprised" || key == "shocked" || key == "astonished")
    return CharacterEmotion::Surprised;
  if (key == "thoughtful" || key == "contemplative" || key == "pensive")
    return CharacterEmotion::Thoughtful;
  if (key == "worried" || key == "anxious" || key == "nervous")
    return CharacterEmotion::Worried;
  if (key == "excited" || key == "enthusiastic" || key == "thrilled")
    return CharacterEmotion::Excited;
  if (key == "determined" || key == "resolute")
    return CharacterEmotion::Determined;
  if (key == "powerful" || key == "mighty")
    return CharacterEmotion::Powerful;
  if (key == "ethereal" || key == "otherworldly")
    return CharacterEmotion::Ethereal;
  return CharacterEmotion::Neutral;
}

void CharacterStatePatch::applyTo(CharacterState& state) const {
  if (position)
    state.position = *position;
  if (currentEmotion)
    state.currentEmotion = *currentEmotion;
  if (currentAnimation)
    state.currentAnimation = *currentAnimation;
  if (isVisible)
    state.isVisible = *isVisible;
  if (customState)
    state.customState = *customState;
}

const char* actionTypeName(CharacterActionType type) {
  switch (type) {
  case CharacterActionType::Enter:
    return "ENTER";
  case CharacterActionType::Exit:
    return "EXIT";
  case CharacterActionType::Move:
    return "MOVE";
  case CharacterActionType::ChangeEmotion:
    return "CHANGE_EMOTION";
  case CharacterActionType::Animate:
    return "ANIMATE";
  case CharacterActionType::Speak:
    return "SPEAK";
  }
  return "ANIMATE";
}

void to_json(nlohmann::json& j, const CharacterState& state) {
  j = nlohmann::json{{"id", state.id},
                     {"position", positionName(state.position)},
                     {"currentEmotion", emotionName(state.currentEmotion)},
                     {"isVisible", state.isVisible},
                     {"customState", state.customState}};
  if (state.currentAnimation) {
    j["currentAnimation"] = *state.currentAnimation;
  }
}

void from_json(const nlohmann::json& j, CharacterState& state) {
  state.id = j.at("id").get<std::string>();

  auto position = parsePosition(j.at("position").get<std::string>());
  if (!position) {
    throw std::invalid_argument("invalid character position '" +
                                j.at("position").get<std::string>() + "'");
  }
  state.position = *position;

  auto emotion = parseEmotion(j.at("currentEmotion").get<std::string>());
  if (!emotion) {
    throw std::invalid_argument("invalid character emotion '" +
                                j.at("currentEmotion").get<std::string>() + "'");
  }
  state.currentEmotion = *emotion;

  state.isVisible = j.value("isVisible", false);
  state.customState = j.value("customState", nlohmann::json::object());

  if (auto it = j.find("currentAnimation"); it != j.end() && it->is_string()) {
    state.currentAnimation = it->get<std::string>();
  } else {
    state.currentAnimation.reset();
  }
}

} // namespace Narrata::character
