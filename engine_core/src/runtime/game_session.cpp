#include "Narrata/runtime/game_session.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/story/story_parser.hpp"
#include "Narrata/story/story_validator.hpp"
#include <fstream>
#include <sstream>

namespace Narrata::runtime {

using story::StoryError;

namespace {

character::ActionGeneratorConfig generatorConfig(const CharacterSettings& settings) {
  character::ActionGeneratorConfig config;
  config.enterDuration = settings.enterDuration;
  config.exitDuration = settings.exitDuration;
  config.moveDuration = settings.moveDuration;
  config.emoteBaseline = settings.emoteBaseline;
  config.randomSeed = settings.randomSeed;
  return config;
}

} // namespace

GameSession::GameSession(const RuntimeConfig& config)
    : m_config(config), m_story(std::make_unique<story::StoryManager>()),
      m_characters(std::make_unique<character::CharacterStateManager>()),
      m_generator(
          std::make_unique<character::CharacterActionGenerator>(generatorConfig(config.characters))),
      m_saves(std::make_unique<save::SaveManager>()) {
  m_director = std::make_unique<dialogue::DialogueDirector>(*m_story, *m_characters, *m_generator);

  m_story->setTraceTransitions(m_config.debug.traceTransitions);

  save::SaveConfig saveConfig;
  saveConfig.maxSlots = m_config.saves.maxSlots;
  m_saves->setConfig(saveConfig);
  m_saves->setSavePath(m_config.saves.saveDirectory);
}

GameSession::~GameSession() {
  // Detach the director before the story manager goes away
  m_director.reset();
}

Result<void, StoryError> GameSession::loadStory(story::Story story) {
  auto result = m_story->loadStory(std::move(story));
  if (result.isError()) {
    return result;
  }
  onStoryInstalled();
  return result;
}

Result<void, StoryError> GameSession::loadStoryFile(const std::string& path) {
  if (m_config.story.format.empty()) {
    auto result = m_story->loadFromFile(path);
    if (result.isOk()) {
      onStoryInstalled();
    }
    return result;
  }

  auto format = story::parseStoryFormat(m_config.story.format);
  if (!format) {
    return Result<void, StoryError>::error(
        StoryError::formatError("Unknown story format '" + m_config.story.format + "'"));
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<void, StoryError>::error(
        StoryError::formatError("Cannot open story file: " + path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = story::StoryParser::parse(buffer.str(), *format);
  if (parsed.isError()) {
    return Result<void, StoryError>::error(parsed.error());
  }
  return loadStory(std::move(parsed).value());
}

void GameSession::onStoryInstalled() {
  m_characters->clear();
  registerStoryCharacters();
  if (m_config.story.validateOnLoad) {
    reportDiagnostics();
  }
}

void GameSession::reportDiagnostics() const {
  const story::Story* story = m_story->getStory();
  if (!story) {
    return;
  }

  if (m_config.story.warnUnreachable) {
    for (const auto& id : story::StoryValidator::findUnreachableNodes(*story)) {
      NARRATA_LOG_WARN("Node '{}' is unreachable from '{}'", id, story->startNode);
    }
  }

  for (const auto& cycle : story::StoryValidator::findAutoProgressCycles(*story)) {
    std::string members;
    for (const auto& id : cycle) {
      members += members.empty() ? id : ", " + id;
    }
    NARRATA_LOG_WARN("Scene/branch nodes may auto-progress forever: {}", members);
  }

  for (const auto& diagnostic : story::StoryValidator::findScriptErrors(*story)) {
    NARRATA_LOG_WARN("Node '{}' field '{}': {}", diagnostic.nodeId, diagnostic.field,
                     diagnostic.message);
  }
}

void GameSession::registerStoryCharacters() {
  const story::Story* story = m_story->getStory();
  if (!story) {
    return;
  }
  for (const auto& [id, declared] : story->assets.characters) {
    dialogue::CharacterDefinition definition;
    definition.name = declared.name;
    definition.displayName = declared.displayName;
    definition.textColor = declared.textColor;
    definition.textSpeed = declared.textSpeed;
    m_director->registerCharacter(id, std::move(definition));
  }
  NARRATA_LOG_DEBUG("Registered {} story characters", story->assets.characters.size());
}

Result<void, StoryError> GameSession::start() { return m_story->start(); }

size_t GameSession::update() { return m_story->processPendingTransitions(); }

save::SaveData GameSession::createSaveData(const std::string& name) const {
  save::SaveData data;
  data.version = m_config.saves.formatVersion;
  data.name = name;
  data.currentNodeId = m_story->getCurrentNodeId().value_or("");
  data.visitedNodes = m_story->getVisitedNodes();
  data.completedBranches = m_story->getCompletedBranches();
  data.characterStates = m_characters->exportForSave();
  data.gameState = m_story->getGameState();
  if (const story::Story* story = m_story->getStory()) {
    data.customData["storyId"] = story->id;
  }
  if (m_screenshotProvider) {
    data.screenshot = m_screenshotProvider->captureThumbnail();
  }
  return data;
}

Result<void, StoryError> GameSession::restoreFromSaveData(const save::SaveData& data) {
  const story::Story* story = m_story->getStory();
  if (!story) {
    return Result<void, StoryError>::error(
        StoryError(story::StoryErrorCode::NoStoryLoaded, "No story loaded"));
  }

  if (auto it = data.customData.find("storyId");
      it != data.customData.end() && it->is_string() && it->get<std::string>() != story->id) {
    NARRATA_LOG_WARN("Save '{}' was made for story '{}', restoring into '{}'", data.name,
                     it->get<std::string>(), story->id);
  }

  m_generator->reset();

  auto result =
      m_story->loadProgress(data.currentNodeId, data.visitedNodes, data.completedBranches);
  if (result.isError()) {
    return result;
  }

  m_characters->loadFromSaveData(data.characterStates);
  m_story->replaceGameState(data.gameState);

  NARRATA_LOG_INFO("Restored save '{}' at node '{}'", data.name, data.currentNodeId);
  return result;
}

Result<void> GameSession::saveToSlot(i32 slot, const std::string& name) {
  if (!m_story->getCurrentNode()) {
    return Result<void>::error("Nothing to save: the story has not started");
  }
  return m_saves->save(slot, createSaveData(name));
}

Result<void> GameSession::loadFromSlot(i32 slot) {
  auto loaded = m_saves->load(slot);
  if (loaded.isError()) {
    return Result<void>::error(loaded.error());
  }
  auto restored = restoreFromSaveData(loaded.value());
  if (restored.isError()) {
    return Result<void>::error(restored.error().format());
  }
  return Result<void>::ok();
}

} // namespace Narrata::runtime
