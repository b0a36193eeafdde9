/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "Narrata/runtime/config_manager.hpp"
#include "Narrata/core/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Narrata::runtime {

namespace {

// Reads json[key] into target when present; throws nlohmann::json::type_error on a type mismatch
template <typename T> void readKey(const nlohmann::json& section, const char* key, T& target) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

const nlohmann::json* findSection(const nlohmann::json& json, const char* name) {
  auto it = json.find(name);
  if (it == json.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string("section '") + name + "' must be an object");
  }
  return &*it;
}

} // namespace

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::initialize(const std::string& basePath) {
  m_basePath = basePath;

  if (!m_basePath.empty() && m_basePath.back() != '/' && m_basePath.back() != '\\') {
    m_basePath += '/';
  }

  auto dirResult = ensureDirectories();
  if (dirResult.isError()) {
    return dirResult;
  }

  m_initialized = true;
  return Result<void>::ok();
}

Result<void> ConfigManager::loadConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  m_config = RuntimeConfig();
  m_baseConfig = RuntimeConfig();

  std::string baseConfigPath = getConfigPath() + "runtime_config.json";
  auto baseResult = loadLayer(baseConfigPath);
  if (baseResult.isError()) {
    return Result<void>::error(baseResult.error());
  }
  if (!baseResult.value()) {
    NARRATA_LOG_WARN("No runtime_config.json in {} - using defaults", getConfigPath());
  }
  m_baseConfig = m_config;

  std::string userConfigPath = getConfigPath() + "runtime_user.json";
  auto userResult = loadLayer(userConfigPath);
  if (userResult.isError()) {
    return Result<void>::error(userResult.error());
  }
  if (!userResult.value()) {
    NARRATA_LOG_INFO("No user config found, using base config");
  }

  NARRATA_LOG_INFO("Configuration loaded successfully");
  return Result<void>::ok();
}

Result<bool> ConfigManager::loadLayer(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<bool>::ok(false);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<bool>::error("Cannot open file: " + path);
  }

  nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded()) {
    return Result<bool>::error("Invalid JSON in " + path);
  }

  auto applied = applyJson(json, m_config);
  if (applied.isError()) {
    return Result<bool>::error(path + ": " + applied.error());
  }
  return Result<bool>::ok(true);
}

Result<void> ConfigManager::applyJson(const nlohmann::json& json, RuntimeConfig& config) {
  if (!json.is_object()) {
    return Result<void>::error("configuration root must be an object");
  }

  try {
    readKey(json, "version", config.version);

    if (const auto* game = findSection(json, "game")) {
      readKey(*game, "name", config.game.name);
      readKey(*game, "version", config.game.version);
    }

    if (const auto* story = findSection(json, "story")) {
      readKey(*story, "file", config.story.file);
      readKey(*story, "format", config.story.format);
      readKey(*story, "validateOnLoad", config.story.validateOnLoad);
      readKey(*story, "warnUnreachable", config.story.warnUnreachable);
    }

    if (const auto* characters = findSection(json, "characters")) {
      readKey(*characters, "enterDuration", config.characters.enterDuration);
      readKey(*characters, "exitDuration", config.characters.exitDuration);
      readKey(*characters, "moveDuration", config.characters.moveDuration);
      readKey(*characters, "emoteBaseline", config.characters.emoteBaseline);
      readKey(*characters, "randomSeed", config.characters.randomSeed);
    }

    if (const auto* saves = findSection(json, "saves")) {
      readKey(*saves, "saveDirectory", config.saves.saveDirectory);
      readKey(*saves, "maxSlots", config.saves.maxSlots);
      readKey(*saves, "formatVersion", config.saves.formatVersion);
      readKey(*saves, "autoSaveEnabled", config.saves.autoSaveEnabled);
    }

    if (const auto* logging = findSection(json, "logging")) {
      readKey(*logging, "logLevel", config.logging.logLevel);
      readKey(*logging, "logDirectory", config.logging.logDirectory);
      readKey(*logging, "logToFile", config.logging.logToFile);
      readKey(*logging, "logToConsole", config.logging.logToConsole);
    }

    if (const auto* debug = findSection(json, "debug")) {
      readKey(*debug, "traceTransitions", config.debug.traceTransitions);
    }
  } catch (const nlohmann::json::exception& e) {
    return Result<void>::error(e.what());
  } catch (const std::invalid_argument& e) {
    return Result<void>::error(e.what());
  }

  if (config.saves.maxSlots <= 0) {
    return Result<void>::error("saves.maxSlots must be positive");
  }
  if (config.characters.emoteBaseline < 0.0 || config.characters.emoteBaseline > 1.0) {
    return Result<void>::error("characters.emoteBaseline must be within [0, 1]");
  }
  if (!core::parseLogLevel(config.logging.logLevel)) {
    return Result<void>::error("unknown logging.logLevel '" + config.logging.logLevel + "'");
  }

  return Result<void>::ok();
}

nlohmann::json ConfigManager::toJson(const RuntimeConfig& config) {
  return {
      {"version", config.version},
      {"game", {{"name", config.game.name}, {"version", config.game.version}}},
      {"story",
       {{"file", config.story.file},
        {"format", config.story.format},
        {"validateOnLoad", config.story.validateOnLoad},
        {"warnUnreachable", config.story.warnUnreachable}}},
      {"characters",
       {{"enterDuration", config.characters.enterDuration},
        {"exitDuration", config.characters.exitDuration},
        {"moveDuration", config.characters.moveDuration},
        {"emoteBaseline", config.characters.emoteBaseline},
        {"randomSeed", config.characters.randomSeed}}},
      {"saves",
       {{"saveDirectory", config.saves.saveDirectory},
        {"maxSlots", config.saves.maxSlots},
        {"formatVersion", config.saves.formatVersion},
        {"autoSaveEnabled", config.saves.autoSaveEnabled}}},
      {"logging",
       {{"logLevel", config.logging.logLevel},
        {"logDirectory", config.logging.logDirectory},
        {"logToFile", config.logging.logToFile},
        {"logToConsole", config.logging.logToConsole}}},
      {"debug", {{"traceTransitions", config.debug.traceTransitions}}},
  };
}

Result<void> ConfigManager::saveUserConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  // Only keys that differ from the base layer are user overrides
  const nlohmann::json current = toJson(m_config);
  const nlohmann::json base = toJson(m_baseConfig);
  nlohmann::json overrides = nlohmann::json::object();
  for (const auto& [section, values] : current.items()) {
    if (!values.is_object()) {
      continue;
    }
    for (const auto& [key, value] : values.items()) {
      if (base.at(section).at(key) != value) {
        overrides[section][key] = value;
      }
    }
  }

  std::string userConfigPath = getConfigPath() + "runtime_user.json";

  try {
    fs::create_directories(getConfigPath());

    // Write atomically (write to temp, then rename)
    std::string tempPath = userConfigPath + ".tmp";
    {
      std::ofstream file(tempPath, std::ios::trunc);
      if (!file.is_open()) {
        return Result<void>::error("Cannot open file for writing: " + userConfigPath);
      }
      file << overrides.dump(2);
    }

    fs::rename(tempPath, userConfigPath);

    NARRATA_LOG_INFO("User configuration saved to {}", userConfigPath);
    return Result<void>::ok();

  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to save config: ") + e.what());
  }
}

void ConfigManager::resetToDefaults() {
  m_config = RuntimeConfig();
  notifyConfigChanged();
}

void ConfigManager::resetUserSettings() {
  m_config = m_baseConfig;
  notifyConfigChanged();
}

void ConfigManager::setOnConfigChanged(ConfigChangeCallback callback) {
  m_onConfigChanged = std::move(callback);
}

void ConfigManager::notifyConfigChanged() {
  if (m_onConfigChanged) {
    m_onConfigChanged(m_config);
  }
}

Result<void> ConfigManager::ensureDirectories() {
  try {
    fs::create_directories(getConfigPath());
    fs::create_directories(getSavesPath());
    fs::create_directories(getLogsPath());
    return Result<void>::ok();
  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to create directories: ") + e.what());
  }
}

std::string ConfigManager::getConfigPath() const { return m_basePath + "config/"; }

std::string ConfigManager::getSavesPath() const {
  return m_basePath + m_config.saves.saveDirectory + "/";
}

std::string ConfigManager::getLogsPath() const {
  return m_basePath + m_config.logging.logDirectory + "/";
}

void ConfigManager::setLogLevel(const std::string& level) {
  m_config.logging.logLevel = level;
  notifyConfigChanged();
}

void ConfigManager::setTraceTransitions(bool enabled) {
  m_config.debug.traceTransitions = enabled;
  notifyConfigChanged();
}

void ConfigManager::setStoryFile(const std::string& file) {
  m_config.story.file = file;
  notifyConfigChanged();
}

} // namespace Narrata::runtime
