#include "Narrata/story/story_parser.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/story/story_validator.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace Narrata::story {

using nlohmann::json;

namespace {

// Carries the first structural problem out of the typed build
struct BuildFailure {
  StoryError error;
};

[[noreturn]] void reject(const std::string& nodeId, const std::string& field,
                         const std::string& message) {
  throw BuildFailure{StoryError::validation(nodeId, field, message)};
}

std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// ---------------------------------------------------------------------------
// YAML decoding
// ---------------------------------------------------------------------------

json yamlScalar(const YAML::Node& node) {
  const std::string& text = node.Scalar();

  // Quoted and explicitly tagged strings are never reinterpreted
  if (node.Tag() == "!" || node.Tag() == "tag:yaml.org,2002:str") {
    return text;
  }

  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }
  if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
    return nullptr;
  }

  std::string_view digits(text);
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  }

  i64 integer = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), integer);
  if (ec == std::errc() && ptr == digits.data() + digits.size() && !digits.empty()) {
    return integer;
  }

  bool numeric = !text.empty() && (std::isdigit(static_cast<unsigned char>(text.front())) ||
                                   text.front() == '-' || text.front() == '+' ||
                                   text.front() == '.');
  if (numeric) {
    char* end = nullptr;
    f64 value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() + text.size()) {
      return value;
    }
  }

  return text;
}

json yamlNodeToJson(const YAML::Node& node) {
  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar:
    return yamlScalar(node);
  case YAML::NodeType::Sequence: {
    json array = json::array();
    for (const auto& item : node) {
      array.push_back(yamlNodeToJson(item));
    }
    return array;
  }
  case YAML::NodeType::Map: {
    json object = json::object();
    for (const auto& entry : node) {
      object[entry.first.as<std::string>()] = yamlNodeToJson(entry.second);
    }
    return object;
  }
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Field extraction
// ---------------------------------------------------------------------------

const json* find(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::optional<std::string> optString(const json& object, const char* key,
                                     const std::string& nodeId, const std::string& prefix = {}) {
  const json* value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    reject(nodeId, prefix + key, "must be a string");
  }
  return value->get<std::string>();
}

std::string requiredString(const json& object, const char* key, const std::string& nodeId,
                           const std::string& what) {
  auto value = optString(object, key, nodeId);
  if (!value || value->empty()) {
    reject(nodeId, key, what + " is missing required field '" + std::string(key) + "'");
  }
  return *value;
}

std::optional<f64> optNumber(const json& object, const char* key, const std::string& nodeId,
                             const std::string& prefix = {}) {
  const json* value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_number()) {
    reject(nodeId, prefix + key, "must be a number");
  }
  return value->get<f64>();
}

std::optional<bool> optBool(const json& object, const char* key, const std::string& nodeId,
                            const std::string& prefix = {}) {
  const json* value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_boolean()) {
    reject(nodeId, prefix + key, "must be a boolean");
  }
  return value->get<bool>();
}

std::vector<std::string> stringList(const json& object, const char* key,
                                    const std::string& nodeId) {
  std::vector<std::string> out;
  const json* value = find(object, key);
  if (!value) {
    return out;
  }
  if (!value->is_array()) {
    reject(nodeId, key, "must be a list of strings");
  }
  for (const auto& item : *value) {
    if (!item.is_string()) {
      reject(nodeId, key, "must be a list of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

json optMapping(const json& object, const char* key, const std::string& nodeId,
                const std::string& prefix = {}) {
  const json* value = find(object, key);
  if (!value) {
    return nullptr;
  }
  if (!value->is_object()) {
    reject(nodeId, prefix + key, "must be a mapping");
  }
  return *value;
}

// ---------------------------------------------------------------------------
// Typed build
// ---------------------------------------------------------------------------

StoryBackground buildBackground(const json& value, const std::string& nodeId,
                                const std::string& field) {
  StoryBackground background;
  if (value.is_string()) {
    background.id = value.get<std::string>();
    return background;
  }
  if (!value.is_object()) {
    reject(nodeId, field, "must be a background id or a mapping");
  }
  auto id = optString(value, "id", nodeId, field + ".");
  if (!id || id->empty()) {
    reject(nodeId, field + ".id", "background must have an id");
  }
  background.id = *id;
  background.imageId = optString(value, "imageId", nodeId, field + ".");
  background.transition = optString(value, "transition", nodeId, field + ".");
  return background;
}

StoryAudio buildAudio(const json& value, const std::string& nodeId) {
  StoryAudio audio;
  if (value.is_string()) {
    audio.id = value.get<std::string>();
    return audio;
  }
  if (!value.is_object()) {
    reject(nodeId, "audio", "must be an audio id or a mapping");
  }
  auto id = optString(value, "id", nodeId, "audio.");
  if (!id || id->empty()) {
    reject(nodeId, "audio.id", "audio must have an id");
  }
  audio.id = *id;
  audio.file = optString(value, "file", nodeId, "audio.").value_or("");
  audio.volume = optNumber(value, "volume", nodeId, "audio.");
  audio.loop = optBool(value, "loop", nodeId, "audio.");
  audio.fadeIn = optNumber(value, "fadeIn", nodeId, "audio.");
  audio.fadeOut = optNumber(value, "fadeOut", nodeId, "audio.");
  return audio;
}

std::vector<StoryChoice> buildChoices(const json& node, const std::string& nodeId) {
  std::vector<StoryChoice> choices;
  const json* list = find(node, "choices");
  if (!list) {
    return choices;
  }
  if (!list->is_array()) {
    reject(nodeId, "choices", "must be a list");
  }

  for (size_t i = 0; i < list->size(); ++i) {
    const json& entry = (*list)[i];
    std::string field = "choices[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      reject(nodeId, field, "choice must be a mapping");
    }

    StoryChoice choice;
    choice.id = optString(entry, "id", nodeId, field + ".")
                    .value_or(nodeId + "_choice_" + std::to_string(i));
    choice.text = optString(entry, "text", nodeId, field + ".").value_or("");
    choice.nextNode = optString(entry, "nextNode", nodeId, field + ".").value_or("");
    choice.condition = optString(entry, "condition", nodeId, field + ".");
    choice.stateChanges = optMapping(entry, "stateChanges", nodeId, field + ".");
    choices.push_back(std::move(choice));
  }
  return choices;
}

std::optional<std::vector<SceneCharacter>> buildSceneCharacters(const json& node,
                                                                 const std::string& nodeId) {
  const json* list = find(node, "characters");
  if (!list) {
    return std::nullopt;
  }
  if (!list->is_array()) {
    reject(nodeId, "characters", "must be a list");
  }

  std::vector<SceneCharacter> characters;

  for (size_t i = 0; i < list->size(); ++i) {
    const json& entry = (*list)[i];
    std::string field = "characters[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      reject(nodeId, field, "scene character must be a mapping");
    }

    SceneCharacter character;
    auto id = optString(entry, "id", nodeId, field + ".");
    if (!id || id->empty()) {
      reject(nodeId, field + ".id", "character at index " + std::to_string(i) +
                                        " must have an id");
    }
    character.id = *id;

    auto position = optString(entry, "position", nodeId, field + ".");
    if (!position) {
      reject(nodeId, field + ".position", "character '" + *id + "' must have a position");
    }
    auto parsed = character::parsePosition(*position);
    if (!parsed) {
      reject(nodeId, field + ".position",
             "invalid position '" + *position + "' for character '" + *id + "'");
    }
    character.position = *parsed;

    if (auto expression = optString(entry, "expression", nodeId, field + ".")) {
      auto emotion = character::parseEmotion(*expression);
      if (!emotion) {
        reject(nodeId, field + ".expression",
               "invalid expression '" + *expression + "' for character '" + *id + "'");
      }
      character.expression = *emotion;
    }

    characters.push_back(std::move(character));
  }
  return characters;
}

std::vector<StoryAnimation> buildAnimations(const json& node, const std::string& nodeId) {
  std::vector<StoryAnimation> animations;
  const json* list = find(node, "animations");
  if (!list) {
    return animations;
  }
  if (!list->is_array()) {
    reject(nodeId, "animations", "must be a list");
  }

  for (size_t i = 0; i < list->size(); ++i) {
    const json& entry = (*list)[i];
    std::string field = "animations[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      reject(nodeId, field, "animation must be a mapping");
    }

    StoryAnimation animation;
    animation.target = optString(entry, "target", nodeId, field + ".").value_or("");
    animation.type = optString(entry, "type", nodeId, field + ".").value_or("");
    animation.duration = optNumber(entry, "duration", nodeId, field + ".");
    animation.delay = optNumber(entry, "delay", nodeId, field + ".");
    animation.direction = optString(entry, "direction", nodeId, field + ".");
    json parameters = optMapping(entry, "parameters", nodeId, field + ".");
    if (parameters.is_object()) {
      animation.parameters = std::move(parameters);
    }
    animations.push_back(std::move(animation));
  }
  return animations;
}

DialogueOptions buildDialogueOptions(const json& value, const std::string& nodeId) {
  if (!value.is_object()) {
    reject(nodeId, "dialogueOptions", "must be a mapping");
  }

  DialogueOptions options;
  options.speed = optNumber(value, "speed", nodeId, "dialogueOptions.");
  options.autoProgress = optBool(value, "autoProgress", nodeId, "dialogueOptions.");

  if (const json* effects = find(value, "textEffects")) {
    if (!effects->is_object()) {
      reject(nodeId, "dialogueOptions.textEffects", "must be a mapping");
    }
    auto type = optString(*effects, "type", nodeId, "dialogueOptions.textEffects.");
    auto parsed = type ? parseTextEffectType(*type) : std::nullopt;
    if (!parsed) {
      reject(nodeId, "dialogueOptions.textEffects.type",
             "invalid text effect type '" + type.value_or("") +
                 "' (expected wave, shake, bounce or typewriter)");
    }
    TextEffect effect;
    effect.type = *parsed;
    effect.intensity = optNumber(*effects, "intensity", nodeId, "dialogueOptions.textEffects.");
    options.textEffects = effect;
  }

  return options;
}

NodeMetadata buildMetadata(const json& value, const std::string& nodeId) {
  if (!value.is_object()) {
    reject(nodeId, "metadata", "must be a mapping");
  }

  NodeMetadata metadata;

  if (const json* transition = find(value, "transition")) {
    TransitionHint hint;
    if (transition->is_string()) {
      hint.type = transition->get<std::string>();
    } else if (transition->is_object()) {
      hint.type = optString(*transition, "type", nodeId, "metadata.transition.").value_or("");
      hint.duration = optNumber(*transition, "duration", nodeId, "metadata.transition.");
    } else {
      reject(nodeId, "metadata.transition", "must be a string or a mapping");
    }
    metadata.transition = hint;
  }

  if (const json* effect = find(value, "effect")) {
    EffectHint hint;
    if (effect->is_string()) {
      hint.type = effect->get<std::string>();
    } else if (effect->is_object()) {
      hint.type = optString(*effect, "type", nodeId, "metadata.effect.").value_or("");
      hint.intensity = optNumber(*effect, "intensity", nodeId, "metadata.effect.");
      hint.duration = optNumber(*effect, "duration", nodeId, "metadata.effect.");
    } else {
      reject(nodeId, "metadata.effect", "must be a string or a mapping");
    }
    metadata.effect = hint;
  }

  if (const json* animation = find(value, "animation")) {
    if (!animation->is_object()) {
      reject(nodeId, "metadata.animation", "must be a mapping");
    }
    metadata.animationIn = optString(*animation, "in", nodeId, "metadata.animation.");
    metadata.animationOut = optString(*animation, "out", nodeId, "metadata.animation.");
  }

  metadata.textSpeed = optNumber(value, "textSpeed", nodeId, "metadata.");
  metadata.textEffect = optString(value, "textEffect", nodeId, "metadata.");
  metadata.choiceAnimation = optString(value, "choiceAnimation", nodeId, "metadata.");

  if (auto emotion = optString(value, "emotion", nodeId, "metadata.")) {
    auto parsed = character::parseEmotion(*emotion);
    if (!parsed) {
      reject(nodeId, "metadata.emotion", "invalid emotion '" + *emotion + "'");
    }
    metadata.emotion = *parsed;
  }

  return metadata;
}

StoryNodeData buildNode(const std::string& key, const json& value) {
  if (!value.is_object()) {
    reject(key, "", "node must be a mapping");
  }

  StoryNodeData node;
  auto declaredId = optString(value, "id", key);
  if (declaredId && *declaredId != key) {
    reject(key, "id", "node id '" + *declaredId + "' does not match its key '" + key + "'");
  }
  node.id = key;

  auto type = optString(value, "type", key);
  if (!type) {
    reject(key, "type", "node must have a type");
  }
  auto parsedType = parseNodeType(*type);
  if (!parsedType) {
    reject(key, "type", "unknown node type '" + *type + "'");
  }
  node.type = *parsedType;

  node.character = optString(value, "character", key);
  if (!node.character) {
    node.character = optString(value, "characterId", key);
  }
  node.text = optString(value, "text", key);
  node.mood = optString(value, "mood", key);
  node.textSpeed = optNumber(value, "textSpeed", key);

  node.choices = buildChoices(value, key);

  node.sceneId = optString(value, "sceneId", key);
  node.characters = buildSceneCharacters(value, key);
  if (const json* background = find(value, "background")) {
    node.background = buildBackground(*background, key, "background");
  }

  if (const json* audio = find(value, "audio")) {
    node.audio = buildAudio(*audio, key);
  }
  node.animations = buildAnimations(value, key);

  node.condition = optString(value, "condition", key);
  node.onEnter = optString(value, "onEnter", key);
  node.onExit = optString(value, "onExit", key);

  node.nextNode = optString(value, "nextNode", key);
  node.stateChanges = optMapping(value, "stateChanges", key);
  node.tags = stringList(value, "tags", key);

  if (const json* options = find(value, "dialogueOptions")) {
    node.dialogueOptions = buildDialogueOptions(*options, key);
  }
  if (const json* metadata = find(value, "metadata")) {
    node.metadata = buildMetadata(*metadata, key);
  }

  return node;
}

StoryAssets buildAssets(const json& value) {
  StoryAssets assets;
  if (!value.is_object()) {
    reject("", "assets", "must be a mapping");
  }

  for (const char* group : {"images", "audio"}) {
    json entries = optMapping(value, group, "", "assets.");
    if (!entries.is_object()) {
      continue;
    }
    auto& target = std::string_view(group) == "images" ? assets.images : assets.audio;
    for (const auto& [id, path] : entries.items()) {
      if (!path.is_string()) {
        reject("", std::string("assets.") + group + "." + id, "must be a string");
      }
      target[id] = path.get<std::string>();
    }
  }

  json characters = optMapping(value, "characters", "", "assets.");
  if (characters.is_object()) {
    for (const auto& [id, entry] : characters.items()) {
      std::string field = "assets.characters." + id;
      if (!entry.is_object()) {
        reject("", field, "must be a mapping");
      }
      StoryCharacter character;
      character.id = optString(entry, "id", "", field + ".").value_or(id);
      character.name = optString(entry, "name", "", field + ".").value_or(id);
      character.displayName = optString(entry, "displayName", "", field + ".");
      character.avatarId = optString(entry, "avatarId", "", field + ".");
      character.textColor = optString(entry, "textColor", "", field + ".");
      character.textSpeed = optNumber(entry, "textSpeed", "", field + ".");
      assets.characters[id] = std::move(character);
    }
  }

  json backgrounds = optMapping(value, "backgrounds", "", "assets.");
  if (backgrounds.is_object()) {
    for (const auto& [id, entry] : backgrounds.items()) {
      std::string field = "assets.backgrounds." + id;
      StoryBackground background;
      if (entry.is_object() && !entry.contains("id")) {
        json withId = entry;
        withId["id"] = id;
        background = buildBackground(withId, "", field);
      } else {
        background = buildBackground(entry, "", field);
      }
      assets.backgrounds[id] = std::move(background);
    }
  }

  return assets;
}

Story buildStory(const json& document) {
  if (!document.is_object()) {
    reject("", "", "story document must be a mapping");
  }

  Story story;
  story.id = requiredString(document, "id", "", "story");
  story.title = requiredString(document, "title", "", "story");
  story.startNode = requiredString(document, "startNode", "", "story");
  story.author = optString(document, "author", "");
  story.version = optString(document, "version", "");
  story.description = optString(document, "description", "");
  story.tags = stringList(document, "tags", "");

  if (const json* assets = find(document, "assets")) {
    story.assets = buildAssets(*assets);
  }

  if (const json* initial = find(document, "initialState")) {
    if (!initial->is_object()) {
      reject("", "initialState", "initialState must be a mapping");
    }
    story.initialState = *initial;
  }

  const json* nodes = find(document, "nodes");
  if (!nodes || !nodes->is_object() || nodes->empty()) {
    reject("", "nodes", "story must have at least one node");
  }

  for (const auto& [key, value] : nodes->items()) {
    story.nodes.emplace(key, buildNode(key, value));
  }

  return story;
}

} // namespace

const char* storyFormatName(StoryFormat format) {
  return format == StoryFormat::Yaml ? "yaml" : "json";
}

std::optional<StoryFormat> parseStoryFormat(std::string_view name) {
  std::string key = lower(name);
  if (key == "json") {
    return StoryFormat::Json;
  }
  if (key == "yaml" || key == "yml") {
    return StoryFormat::Yaml;
  }
  return std::nullopt;
}

Result<Story, StoryError> StoryParser::fromDocument(const nlohmann::json& document) {
  Story story;
  try {
    story = buildStory(document);
  } catch (const BuildFailure& failure) {
    return Result<Story, StoryError>::error(failure.error);
  }

  auto validation = StoryValidator::validate(story);
  if (validation.isError()) {
    return Result<Story, StoryError>::error(validation.error());
  }

  return Result<Story, StoryError>::ok(std::move(story));
}

Result<Story, StoryError> StoryParser::parseFromJson(std::string_view text) {
  json document;
  try {
    document = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    return Result<Story, StoryError>::error(
        StoryError::formatError(std::string("Failed to parse story JSON: ") + e.what()));
  }
  return fromDocument(document);
}

Result<nlohmann::json, StoryError> StoryParser::yamlToJson(std::string_view text) {
  try {
    YAML::Node root = YAML::Load(std::string(text));
    return Result<json, StoryError>::ok(yamlNodeToJson(root));
  } catch (const YAML::Exception& e) {
    return Result<json, StoryError>::error(
        StoryError::formatError(std::string("Failed to parse story YAML: ") + e.what()));
  }
}

Result<Story, StoryError> StoryParser::parseFromYaml(std::string_view text) {
  auto document = yamlToJson(text);
  if (document.isError()) {
    return Result<Story, StoryError>::error(document.error());
  }
  return fromDocument(document.value());
}

Result<Story, StoryError> StoryParser::parse(std::string_view text, StoryFormat format) {
  return format == StoryFormat::Yaml ? parseFromYaml(text) : parseFromJson(text);
}

std::optional<StoryFormat> StoryParser::formatFromPath(const std::string& path) {
  std::string extension = lower(std::filesystem::path(path).extension().string());
  if (extension == ".json") {
    return StoryFormat::Json;
  }
  if (extension == ".yaml" || extension == ".yml") {
    return StoryFormat::Yaml;
  }
  return std::nullopt;
}

Result<Story, StoryError> StoryParser::parseFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return Result<Story, StoryError>::error(
        StoryError::formatError("Cannot open story file: " + path));
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<Story, StoryError>::error(
        StoryError::formatError("Failed to read story file: " + path));
  }
  std::string text = buffer.str();

  auto format = formatFromPath(path);
  if (!format) {
    auto first = std::find_if(text.begin(), text.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    format = (first != text.end() && *first == '{') ? StoryFormat::Json : StoryFormat::Yaml;
    NARRATA_LOG_DEBUG("Story file '{}' has no known extension, reading it as {}", path,
                      storyFormatName(*format));
  }

  auto story = parse(text, *format);
  if (story.isOk()) {
    NARRATA_LOG_INFO("Loaded story '{}' ({} nodes) from {}", story.value().id,
                     story.value().nodes.size(), path);
  }
  return story;
}

} // namespace Narrata::story
