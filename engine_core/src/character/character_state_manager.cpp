#include "Narrata/character/character_state_manager.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/scripting/value.hpp"
#include <algorithm>
#include <exception>
#include <sstream>

namespace Narrata::character {

std::optional<ConditionOperator> parseConditionOperator(std::string_view op) {
  if (op == "==" || op == "===")
    return ConditionOperator::Equal;
  if (op == "!=" || op == "!==")
    return ConditionOperator::NotEqual;
  if (op == ">")
    return ConditionOperator::Greater;
  if (op == ">=")
    return ConditionOperator::GreaterEqual;
  if (op == "<")
    return ConditionOperator::Less;
  if (op == "<=")
    return ConditionOperator::LessEqual;
  if (op == "contains")
    return ConditionOperator::Contains;
  return std::nullopt;
}

CharacterStateManager::CharacterStateManager() = default;

CharacterStateManager::~CharacterStateManager() = default;

namespace {

// Saves may carry any JSON in customState; writes reset the section they touch
nlohmann::json& customSection(nlohmann::json& custom, const char* name) {
  if (!custom.is_object()) {
    custom = nlohmann::json::object();
  }
  nlohmann::json& section = custom[name];
  if (!section.is_object()) {
    section = nlohmann::json::object();
  }
  return section;
}

} // namespace

template <typename Fn> void CharacterStateManager::notify(const char* event, Fn&& fn) {
  // Listeners may unregister themselves while being notified
  auto listeners = m_listeners;
  for (ICharacterStateListener* listener : listeners) {
    try {
      fn(*listener);
    } catch (const std::exception& e) {
      NARRATA_LOG_ERROR("Character state listener failed while handling {}: {}", event, e.what());
    }
  }
}

void CharacterStateManager::addListener(ICharacterStateListener* listener) {
  if (listener && std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
    m_listeners.push_back(listener);
  }
}

void CharacterStateManager::removeListener(ICharacterStateListener* listener) {
  m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                    m_listeners.end());
}

CharacterState* CharacterStateManager::find(const std::string& id, const char* operation) {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    NARRATA_LOG_WARN("Cannot {}: character '{}' not found", operation, id);
    return nullptr;
  }
  return &it->second;
}

void CharacterStateManager::notifyUpdated(const std::string& id) {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    return;
  }
  const CharacterState state = it->second;
  notify("updated", [&id, &state](ICharacterStateListener& l) { l.onCharacterUpdated(id, state); });
}

bool CharacterStateManager::initializeCharacter(const std::string& id, CharacterState state) {
  if (m_states.contains(id)) {
    return false;
  }

  state.id = id;
  if (!state.customState.is_object()) {
    state.customState = nlohmann::json::object();
  }
  auto [it, inserted] = m_states.emplace(id, std::move(state));

  const CharacterState created = it->second;
  notify("initialized",
         [&id, &created](ICharacterStateListener& l) { l.onCharacterInitialized(id, created); });
  return inserted;
}

bool CharacterStateManager::hasCharacter(const std::string& id) const {
  return m_states.contains(id);
}

std::optional<CharacterState> CharacterStateManager::getCharacterState(const std::string& id) const {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool CharacterStateManager::updateCharacterState(const std::string& id,
                                                 const CharacterStatePatch& patch) {
  CharacterState* state = find(id, "update state");
  if (!state) {
    return false;
  }
  patch.applyTo(*state);
  notifyUpdated(id);
  return true;
}

bool CharacterStateManager::setCharacterEmotion(const std::string& id, CharacterEmotion emotion) {
  if (!find(id, "set emotion")) {
    return false;
  }

  CharacterStatePatch patch;
  patch.currentEmotion = emotion;
  updateCharacterState(id, patch);

  notify("emotionChanged",
         [&id, emotion](ICharacterStateListener& l) { l.onCharacterEmotionChanged(id, emotion); });
  return true;
}

bool CharacterStateManager::applyAction(const CharacterAction& action) {
  CharacterState* state = find(action.characterId, actionTypeName(action.type));
  if (!state) {
    return false;
  }

  CharacterStatePatch patch;

  switch (action.type) {
  case CharacterActionType::Enter:
    patch.isVisible = true;
    patch.position = action.position.value_or(CharacterPosition::Center);
    patch.currentEmotion = action.emotion;
    patch.currentAnimation = action.animation.value_or(animation::WalkIn);
    break;

  case CharacterActionType::Exit:
    patch.isVisible = false;
    if (action.position && isOffScreen(*action.position)) {
      patch.position = action.position;
    } else {
      patch.position = state->position == CharacterPosition::Left
                           ? CharacterPosition::OffScreenLeft
                           : CharacterPosition::OffScreenRight;
    }
    patch.currentAnimation = action.animation.value_or(animation::WalkOut);
    break;

  case CharacterActionType::Move:
    if (!action.position) {
      NARRATA_LOG_WARN("MOVE action for '{}' has no position", action.characterId);
      return false;
    }
    patch.position = action.position;
    break;

  case CharacterActionType::ChangeEmotion:
    if (!action.emotion) {
      NARRATA_LOG_WARN("CHANGE_EMOTION action for '{}' has no emotion", action.characterId);
      return false;
    }
    return setCharacterEmotion(action.characterId, *action.emotion);

  case CharacterActionType::Animate:
    if (!action.animation) {
      NARRATA_LOG_WARN("ANIMATE action for '{}' has no animation", action.characterId);
      return false;
    }
    patch.currentAnimation = action.animation;
    break;

  case CharacterActionType::Speak:
    patch.currentAnimation = animation::Talk;
    patch.currentEmotion = action.emotion;
    break;
  }

  return updateCharacterState(action.characterId, patch);
}

void CharacterStateManager::applyActions(const CharacterActionList& actions) {
  for (const auto& action : actions) {
    applyAction(action);
  }
}

bool CharacterStateManager::removeCharacterState(const std::string& id) {
  if (m_states.erase(id) == 0) {
    NARRATA_LOG_WARN("Cannot remove state: character '{}' not found", id);
    return false;
  }
  notify("removed", [&id](ICharacterStateListener& l) { l.onCharacterRemoved(id); });
  return true;
}

bool CharacterStateManager::setCharacterFlag(const std::string& id, const std::string& flag,
                                             nlohmann::json value) {
  CharacterState* state = find(id, "set flag");
  if (!state) {
    return false;
  }

  CharacterStatePatch patch;
  nlohmann::json custom = state->customState;
  customSection(custom, "flags")[flag] = std::move(value);
  patch.customState = std::move(custom);
  return updateCharacterState(id, patch);
}

nlohmann::json CharacterStateManager::getCharacterFlag(const std::string& id,
                                                       const std::string& flag) const {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    return nullptr;
  }
  const auto& custom = it->second.customState;
  auto flags = custom.find("flags");
  if (flags == custom.end() || !flags->is_object()) {
    return nullptr;
  }
  auto value = flags->find(flag);
  return value != flags->end() ? *value : nlohmann::json();
}

bool CharacterStateManager::adjustRelationship(const std::string& id, const std::string& otherId,
                                               f64 delta) {
  CharacterState* state = find(id, "adjust relationship");
  if (!state) {
    return false;
  }

  nlohmann::json custom = state->customState;
  nlohmann::json& slot = customSection(custom, "relationships")[otherId];
  f64 current = slot.is_number() ? slot.get<f64>() : 0.0;
  slot = current + delta;

  CharacterStatePatch patch;
  patch.customState = std::move(custom);
  return updateCharacterState(id, patch);
}

f64 CharacterStateManager::getRelationship(const std::string& id,
                                           const std::string& otherId) const {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    return 0.0;
  }
  const auto& custom = it->second.customState;
  auto relationships = custom.find("relationships");
  if (relationships == custom.end() || !relationships->is_object()) {
    return 0.0;
  }
  auto value = relationships->find(otherId);
  return (value != relationships->end() && value->is_number()) ? value->get<f64>() : 0.0;
}

bool CharacterStateManager::setNamedState(const std::string& id, const std::string& name) {
  CharacterState* state = find(id, "set named state");
  if (!state) {
    return false;
  }

  if (auto emotion = parseEmotion(name)) {
    return setCharacterEmotion(id, *emotion);
  }

  nlohmann::json custom = state->customState;
  nlohmann::json& flags = customSection(custom, "flags");
  for (auto& [key, value] : flags.items()) {
    if (key.rfind("state_", 0) == 0) {
      value = false;
    }
  }
  std::string key = name.rfind("state_", 0) == 0 ? name : "state_" + name;
  flags[key] = true;

  CharacterStatePatch patch;
  patch.customState = std::move(custom);
  return updateCharacterState(id, patch);
}

bool CharacterStateManager::checkCharacterCondition(const std::string& id,
                                                    const std::string& propertyPath,
                                                    ConditionOperator op,
                                                    const nlohmann::json& value) const {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    return false;
  }

  nlohmann::json current = it->second;
  std::stringstream path(propertyPath);
  std::string part;
  while (std::getline(path, part, '.')) {
    auto next = current.is_object() ? current.find(part) : current.end();
    if (next == current.end()) {
      // A missing property differs from every value and orders against none
      return op == ConditionOperator::NotEqual;
    }
    nlohmann::json child = *next;
    current = std::move(child);
  }

  switch (op) {
  case ConditionOperator::Equal:
    return scripting::valuesEqual(current, value);
  case ConditionOperator::NotEqual:
    return !scripting::valuesEqual(current, value);
  case ConditionOperator::Greater:
  case ConditionOperator::GreaterEqual:
  case ConditionOperator::Less:
  case ConditionOperator::LessEqual: {
    auto order = scripting::compareValues(current, value);
    if (!order) {
      return false;
    }
    if (op == ConditionOperator::Greater)
      return *order > 0;
    if (op == ConditionOperator::GreaterEqual)
      return *order >= 0;
    if (op == ConditionOperator::Less)
      return *order < 0;
    return *order <= 0;
  }
  case ConditionOperator::Contains:
    if (current.is_array()) {
      return std::any_of(current.begin(), current.end(), [&value](const nlohmann::json& item) {
        return scripting::valuesEqual(item, value);
      });
    }
    if (current.is_string() && value.is_string()) {
      return current.get<std::string>().find(value.get<std::string>()) != std::string::npos;
    }
    return false;
  }
  return false;
}

void CharacterStateManager::loadFromSaveData(const CharacterStateMap& states) {
  m_states = states;
  for (auto& [id, state] : m_states) {
    state.id = id;
  }
  const CharacterStateMap loaded = m_states;
  notify("loaded", [&loaded](ICharacterStateListener& l) { l.onCharacterStatesLoaded(loaded); });
}

void CharacterStateManager::clear() {
  m_states.clear();
  notify("cleared", [](ICharacterStateListener& l) { l.onCharacterStatesCleared(); });
}

void CharacterStateManager::reset() {
  clear();
  notify("reset", [](ICharacterStateListener& l) { l.onCharacterStatesReset(); });
}

} // namespace Narrata::character
