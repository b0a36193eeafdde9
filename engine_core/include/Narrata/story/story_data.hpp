#pragma once

/**
 * @file story_data.hpp
 * @brief Typed story document: nodes, choices, assets and metadata
 *
 * A Story is produced by StoryParser and is treated as immutable once
 * handed to StoryManager. Referential integrity (startNode, nextNode and
 * choice targets) is guaranteed by StoryValidator before that point.
 */

#include "Narrata/character/character_types.hpp"
#include "Narrata/core/types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Narrata::story {

enum class NodeType { Dialogue, Scene, Choice, Branch, End };

[[nodiscard]] const char* nodeTypeName(NodeType type);
[[nodiscard]] std::optional<NodeType> parseNodeType(std::string_view name);

struct StoryChoice {
  std::string id;
  std::string text;
  std::string nextNode;
  std::optional<std::string> condition;
  nlohmann::json stateChanges; // object, or null when absent
};

// One entry of a scene node's blocking declaration
struct SceneCharacter {
  std::string id;
  character::CharacterPosition position = character::CharacterPosition::Center;
  std::optional<character::CharacterEmotion> expression;
};

struct StoryAnimation {
  std::string target;
  std::string type;
  std::optional<f64> duration;
  std::optional<f64> delay;
  std::optional<std::string> direction;
  nlohmann::json parameters = nlohmann::json::object();
};

struct StoryAudio {
  std::string id;
  std::string file;
  std::optional<f64> volume;
  std::optional<bool> loop;
  std::optional<f64> fadeIn;
  std::optional<f64> fadeOut;
};

struct StoryBackground {
  std::string id;
  std::optional<std::string> imageId;
  std::optional<std::string> transition;
};

enum class TextEffectType { Wave, Shake, Bounce, Typewriter };

[[nodiscard]] const char* textEffectTypeName(TextEffectType type);
[[nodiscard]] std::optional<TextEffectType> parseTextEffectType(std::string_view name);

struct TextEffect {
  TextEffectType type = TextEffectType::Typewriter;
  std::optional<f64> intensity;
};

struct DialogueOptions {
  std::optional<f64> speed;
  std::optional<bool> autoProgress;
  std::optional<TextEffect> textEffects;
};

struct TransitionHint {
  std::string type;
  std::optional<f64> duration;
};

struct EffectHint {
  std::string type;
  std::optional<f64> intensity;
  std::optional<f64> duration;
};

struct NodeMetadata {
  std::optional<TransitionHint> transition;
  std::optional<EffectHint> effect;
  std::optional<std::string> animationIn;
  std::optional<std::string> animationOut;
  std::optional<f64> textSpeed;
  std::optional<std::string> textEffect;
  std::optional<character::CharacterEmotion> emotion;
  std::optional<std::string> choiceAnimation;
};

struct StoryNodeData {
  std::string id;
  NodeType type = NodeType::Dialogue;

  // dialogue
  std::optional<std::string> character;
  std::optional<std::string> text;
  std::optional<std::string> mood;
  std::optional<f64> textSpeed;

  // choice
  std::vector<StoryChoice> choices;

  // scene
  std::optional<std::string> sceneId;
  // Absent leaves the stage untouched; an empty list clears it
  std::optional<std::vector<SceneCharacter>> characters;
  std::optional<StoryBackground> background;

  std::optional<StoryAudio> audio;
  std::vector<StoryAnimation> animations;

  std::optional<std::string> condition;
  std::optional<std::string> onEnter;
  std::optional<std::string> onExit;

  std::optional<std::string> nextNode;
  nlohmann::json stateChanges; // object, or null when absent

  std::vector<std::string> tags;
  std::optional<DialogueOptions> dialogueOptions;
  std::optional<NodeMetadata> metadata;
};

struct StoryCharacter {
  std::string id;
  std::string name;
  std::optional<std::string> displayName;
  std::optional<std::string> avatarId;
  std::optional<std::string> textColor;
  std::optional<f64> textSpeed;
};

struct StoryAssets {
  std::map<std::string, std::string> images;
  std::map<std::string, std::string> audio;
  std::map<std::string, StoryCharacter> characters;
  std::map<std::string, StoryBackground> backgrounds;
};

struct Story {
  std::string id;
  std::string title;
  std::optional<std::string> author;
  std::optional<std::string> version;
  std::optional<std::string> description;
  std::vector<std::string> tags;

  StoryAssets assets;
  nlohmann::json initialState = nlohmann::json::object();

  std::string startNode;
  std::map<std::string, StoryNodeData> nodes;
};

} // namespace Narrata::story
