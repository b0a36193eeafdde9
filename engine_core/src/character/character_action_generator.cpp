#include "Narrata/character/character_action_generator.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/story/story_node.hpp"
#include <algorithm>
#include <cctype>

namespace Narrata::character {

namespace {

std::string toLower(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool isShouted(const std::string& word) {
  if (word.size() <= 1) {
    return false;
  }
  return std::none_of(word.begin(), word.end(),
                      [](unsigned char c) { return std::islower(c) != 0; });
}

} // namespace

CharacterActionGenerator::CharacterActionGenerator()
    : CharacterActionGenerator(ActionGeneratorConfig{}) {}

CharacterActionGenerator::CharacterActionGenerator(const ActionGeneratorConfig& config)
    : m_config(config) {
  if (m_config.randomSeed != 0) {
    m_engine.seed(m_config.randomSeed);
  } else {
    std::random_device device;
    m_engine.seed(device());
  }
}

CharacterActionGenerator::~CharacterActionGenerator() = default;

void CharacterActionGenerator::setRandomSource(RandomSource source) {
  m_random = std::move(source);
}

f64 CharacterActionGenerator::nextRandom() {
  if (m_random) {
    return m_random();
  }
  std::uniform_real_distribution<f64> distribution(0.0, 1.0);
  return distribution(m_engine);
}

CharacterActionList
CharacterActionGenerator::generateActionsFromNode(const story::StoryNode& node,
                                                  const CharacterStateMap& characters) {
  CharacterActionList actions;

  m_recentNodeIds.push_front(node.getId());
  if (m_recentNodeIds.size() > MaxRecentNodes) {
    m_recentNodeIds.pop_back();
  }

  switch (node.getType()) {
  case story::NodeType::Scene:
    if (auto sceneId = node.getSceneId()) {
      m_currentSceneId = *sceneId;
      if (node.getCharacters()) {
        // Exits first so two characters never share a position mid-transition
        generateExits(node, characters, actions);
        generateEntrances(node, characters, actions);
      }
    }
    break;
  case story::NodeType::Dialogue:
    generateDialogueActions(node, characters, actions);
    break;
  default:
    break;
  }

  for (const auto& animation : node.getAnimations()) {
    if (!characters.contains(animation.target)) {
      NARRATA_LOG_DEBUG("Skipping animation '{}' for unknown character '{}' on node '{}'",
                        animation.type, animation.target, node.getId());
      continue;
    }

    CharacterAction action;
    action.type = CharacterActionType::Animate;
    action.characterId = animation.target;
    action.animation = animation.type;
    action.duration = animation.duration;
    action.customParams =
        animation.parameters.is_object() ? animation.parameters : nlohmann::json::object();
    actions.push_back(std::move(action));
  }

  return actions;
}

void CharacterActionGenerator::generateExits(const story::StoryNode& node,
                                             const CharacterStateMap& characters,
                                             CharacterActionList& actions) const {
  const auto& declared = *node.getCharacters();

  for (const auto& [id, state] : characters) {
    if (!state.isVisible) {
      continue;
    }
    bool staying = std::any_of(declared.begin(), declared.end(),
                               [&id](const story::SceneCharacter& c) { return c.id == id; });
    if (staying) {
      continue;
    }

    CharacterAction action;
    action.type = CharacterActionType::Exit;
    action.characterId = id;
    action.position = state.position == CharacterPosition::Left ? CharacterPosition::OffScreenLeft
                                                                : CharacterPosition::OffScreenRight;
    action.duration = m_config.exitDuration;
    actions.push_back(std::move(action));
  }
}

void CharacterActionGenerator::generateEntrances(const story::StoryNode& node,
                                                 const CharacterStateMap& characters,
                                                 CharacterActionList& actions) const {
  for (const auto& declared : *node.getCharacters()) {
    auto it = characters.find(declared.id);
    if (it == characters.end()) {
      NARRATA_LOG_WARN("Scene '{}' lists unknown character '{}'", node.getId(), declared.id);
      continue;
    }
    const CharacterState& state = it->second;

    if (!state.isVisible) {
      CharacterAction action;
      action.type = CharacterActionType::Enter;
      action.characterId = declared.id;
      action.position = declared.position;
      action.emotion = declared.expression.value_or(state.currentEmotion);
      action.duration = m_config.enterDuration;
      actions.push_back(std::move(action));
    } else if (state.position != declared.position) {
      CharacterAction action;
      action.type = CharacterActionType::Move;
      action.characterId = declared.id;
      action.position = declared.position;
      action.duration = m_config.moveDuration;
      actions.push_back(std::move(action));
    }

    if (declared.expression && *declared.expression != state.currentEmotion) {
      CharacterAction action;
      action.type = CharacterActionType::ChangeEmotion;
      action.characterId = declared.id;
      action.emotion = declared.expression;
      actions.push_back(std::move(action));
    }
  }
}

void CharacterActionGenerator::generateDialogueActions(const story::StoryNode& node,
                                                       const CharacterStateMap& characters,
                                                       CharacterActionList& actions) {
  const auto& speakerId = node.getCharacterId();
  if (!speakerId) {
    return;
  }
  auto it = characters.find(*speakerId);
  if (it == characters.end()) {
    NARRATA_LOG_WARN("Dialogue node '{}' is spoken by unknown character '{}'", node.getId(),
                     *speakerId);
    return;
  }

  const CharacterState& state = it->second;
  const auto& mood = node.getMood();
  const CharacterEmotion emotion = determineEmotion(mood, state);

  if (!state.isVisible) {
    CharacterAction action;
    action.type = CharacterActionType::Enter;
    action.characterId = *speakerId;
    action.position = CharacterPosition::Center;
    action.emotion = emotion;
    action.duration = m_config.enterDuration;
    actions.push_back(std::move(action));
  }

  if (mood && emotion != state.currentEmotion) {
    CharacterAction action;
    action.type = CharacterActionType::ChangeEmotion;
    action.characterId = *speakerId;
    action.emotion = emotion;
    actions.push_back(std::move(action));
  }

  const auto& text = node.getText();
  if (!text || text->empty()) {
    return;
  }

  CharacterAction speak;
  speak.type = CharacterActionType::Speak;
  speak.characterId = *speakerId;
  speak.text = *text;
  speak.emotion = emotion;
  actions.push_back(std::move(speak));

  if (shouldEmoteAfterSpeaking(*text, mood)) {
    CharacterAction emote;
    emote.type = CharacterActionType::Animate;
    emote.characterId = *speakerId;
    emote.animation = animation::Emote;
    emote.customParams = {{"intensity", determineEmoteIntensity(*text, mood)}};
    actions.push_back(std::move(emote));
  }
}

CharacterEmotion CharacterActionGenerator::determineEmotion(const std::optional<std::string>& mood,
                                                            const CharacterState& state) {
  if (!mood || mood->empty()) {
    return state.currentEmotion;
  }
  return emotionFromMood(*mood);
}

bool CharacterActionGenerator::shouldEmoteAfterSpeaking(const std::string& text,
                                                        const std::optional<std::string>& mood) {
  if (text.find_first_of("!?") != std::string::npos) {
    return true;
  }

  if (mood) {
    const std::string lowered = toLower(*mood);
    if (lowered == "excited" || lowered == "angry" || lowered == "surprised") {
      return true;
    }
  }

  return nextRandom() < m_config.emoteBaseline;
}

f64 CharacterActionGenerator::determineEmoteIntensity(const std::string& text,
                                                      const std::optional<std::string>& mood) {
  f64 intensity = 0.5;

  intensity += static_cast<f64>(std::count(text.begin(), text.end(), '!')) * 0.1;
  intensity += static_cast<f64>(std::count(text.begin(), text.end(), '?')) * 0.05;

  // Words are split on single spaces, so runs of spaces count as empty words
  usize words = 0;
  usize shouted = 0;
  usize start = 0;
  while (true) {
    usize end = text.find(' ', start);
    std::string word = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    ++words;
    if (isShouted(word)) {
      ++shouted;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  intensity += static_cast<f64>(shouted) / static_cast<f64>(words) * 0.2;

  if (mood) {
    const std::string lowered = toLower(*mood);
    if (lowered == "excited" || lowered == "angry") {
      intensity += 0.2;
    } else if (lowered == "surprised") {
      intensity += 0.15;
    } else if (lowered == "sad" || lowered == "thoughtful") {
      intensity -= 0.1;
    }
  }

  return std::clamp(intensity, 0.1, 1.0);
}

CharacterPosition CharacterActionGenerator::determineEnterPosition(CharacterPosition speakerPosition) {
  switch (speakerPosition) {
  case CharacterPosition::Left:
    return CharacterPosition::Right;
  case CharacterPosition::Right:
    return CharacterPosition::Left;
  case CharacterPosition::Center:
    return nextRandom() < 0.5 ? CharacterPosition::Left : CharacterPosition::Right;
  default:
    return CharacterPosition::Center;
  }
}

CharacterActionList
CharacterActionGenerator::generateContextualActions(const story::StoryNode& currentNode,
                                                    const story::StoryNode* nextNode,
                                                    const CharacterStateMap& characters) {
  CharacterActionList actions;
  if (!nextNode) {
    return actions;
  }

  const auto& currentSpeaker = currentNode.getCharacterId();
  const auto& nextSpeaker = nextNode->getCharacterId();
  if (!currentSpeaker || !nextSpeaker || *currentSpeaker == *nextSpeaker) {
    return actions;
  }

  auto current = characters.find(*currentSpeaker);
  auto next = characters.find(*nextSpeaker);
  if (current == characters.end() || next == characters.end()) {
    return actions;
  }
  const CharacterState& currentState = current->second;
  const CharacterState& nextState = next->second;

  if (!nextState.isVisible) {
    CharacterAction enter;
    enter.type = CharacterActionType::Enter;
    enter.characterId = *nextSpeaker;
    enter.position = determineEnterPosition(currentState.position);
    enter.emotion = determineEmotion(nextNode->getMood(), nextState);
    enter.duration = m_config.enterDuration;
    actions.push_back(std::move(enter));
  }

  if (currentState.isVisible && nextState.isVisible &&
      currentState.position != nextState.position) {
    CharacterAction look;
    look.type = CharacterActionType::Animate;
    look.characterId = *currentSpeaker;
    look.animation = animation::LookAt;
    look.customParams = {{"target", positionName(nextState.position)}};
    actions.push_back(std::move(look));
  }

  return actions;
}

void CharacterActionGenerator::reset() {
  m_currentSceneId.reset();
  m_recentNodeIds.clear();
}

std::vector<std::string> CharacterActionGenerator::getRecentNodeIds() const {
  return {m_recentNodeIds.begin(), m_recentNodeIds.end()};
}

} // namespace Narrata::character
