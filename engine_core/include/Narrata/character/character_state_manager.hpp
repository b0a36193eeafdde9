#pragma once

/**
 * @file character_state_manager.hpp
 * @brief Owner of live per-character presentation state
 *
 * Every character known to the session has exactly one CharacterState
 * here. Updates addressed to an unknown character are ignored with a
 * warning; narrative content may mention characters that were never
 * registered.
 */

#include "Narrata/character/character_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Narrata::character {

using CharacterStateMap = std::map<std::string, CharacterState>;

/**
 * @brief Receives character state notifications; methods default to no-ops
 */
class ICharacterStateListener {
public:
  virtual ~ICharacterStateListener() = default;

  virtual void onCharacterInitialized(const std::string& /*id*/, const CharacterState& /*state*/) {}
  virtual void onCharacterUpdated(const std::string& /*id*/, const CharacterState& /*state*/) {}
  virtual void onCharacterEmotionChanged(const std::string& /*id*/, CharacterEmotion /*emotion*/) {}
  virtual void onCharacterRemoved(const std::string& /*id*/) {}
  virtual void onCharacterStatesLoaded(const CharacterStateMap& /*states*/) {}
  virtual void onCharacterStatesCleared() {}
  virtual void onCharacterStatesReset() {}
};

enum class ConditionOperator { Equal, NotEqual, Greater, GreaterEqual, Less, LessEqual, Contains };

[[nodiscard]] std::optional<ConditionOperator> parseConditionOperator(std::string_view op);

class CharacterStateManager {
public:
  CharacterStateManager();
  ~CharacterStateManager();

  /**
   * @brief Register a character with @p state
   *
   * Idempotent: a character that already exists keeps its current state.
   * @return true if the character was created
   */
  bool initializeCharacter(const std::string& id, CharacterState state = {});

  [[nodiscard]] bool hasCharacter(const std::string& id) const;
  [[nodiscard]] std::optional<CharacterState> getCharacterState(const std::string& id) const;
  [[nodiscard]] CharacterStateMap getAllCharacterStates() const { return m_states; }

  /**
   * @brief Merge @p patch into the character's state and notify
   *
   * An empty patch changes nothing but still notifies.
   * @return false if the character is unknown
   */
  bool updateCharacterState(const std::string& id, const CharacterStatePatch& patch);
  bool setCharacterEmotion(const std::string& id, CharacterEmotion emotion);

  /**
   * @brief Apply one presentation action to the character it targets
   */
  bool applyAction(const CharacterAction& action);
  void applyActions(const CharacterActionList& actions);

  bool removeCharacterState(const std::string& id);

  // customState.flags / customState.relationships helpers
  bool setCharacterFlag(const std::string& id, const std::string& flag, nlohmann::json value);
  [[nodiscard]] nlohmann::json getCharacterFlag(const std::string& id,
                                                const std::string& flag) const;
  bool adjustRelationship(const std::string& id, const std::string& otherId, f64 delta);
  [[nodiscard]] f64 getRelationship(const std::string& id, const std::string& otherId) const;

  /**
   * @brief Put a character into a named state
   *
   * An emotion name sets the emotion. Any other name sets the flag
   * "state_<name>" and clears every other "state_" flag.
   */
  bool setNamedState(const std::string& id, const std::string& name);

  /**
   * @brief Compare a property of a character's state against @p value
   *
   * @p propertyPath is dotted and descends into customState, e.g.
   * "customState.flags.met" or "currentEmotion". Unknown characters compare
   * false. A missing property only satisfies NotEqual.
   */
  [[nodiscard]] bool checkCharacterCondition(const std::string& id,
                                             const std::string& propertyPath,
                                             ConditionOperator op,
                                             const nlohmann::json& value) const;

  [[nodiscard]] CharacterStateMap exportForSave() const { return m_states; }
  void loadFromSaveData(const CharacterStateMap& states);

  /**
   * @brief Drop every character
   */
  void clear();

  /**
   * @brief clear() and notify listeners of the reset
   */
  void reset();

  void addListener(ICharacterStateListener* listener);
  void removeListener(ICharacterStateListener* listener);

private:
  CharacterState* find(const std::string& id, const char* operation);
  void notifyUpdated(const std::string& id);

  template <typename Fn> void notify(const char* event, Fn&& fn);

  CharacterStateMap m_states;
  std::vector<ICharacterStateListener*> m_listeners;
};

} // namespace Narrata::character
