#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - Load/Save runtime configuration
 *
 * Handles:
 * - Loading runtime_config.json (base configuration)
 * - Loading/Saving runtime_user.json (user overrides)
 * - Directory creation for config, saves and logs
 */

#include "Narrata/core/result.hpp"
#include "Narrata/core/types.hpp"
#include "Narrata/runtime/runtime_config.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace Narrata::runtime {

using ConfigChangeCallback = std::function<void(const RuntimeConfig&)>;

/**
 * @brief Configuration Manager
 *
 * Layers, lowest precedence first:
 * 1. Defaults (built-in)
 * 2. config/runtime_config.json (shipped with the story, never written)
 * 3. config/runtime_user.json (user overrides, read-write)
 *
 * A layer only overrides the keys it contains.
 */
class ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Initialize with a base directory
   * @param basePath Directory that contains config/
   */
  Result<void> initialize(const std::string& basePath);

  /**
   * @brief Load defaults, then the base file, then the user file
   *
   * Missing files are not an error. A file that exists but cannot be
   * parsed is.
   */
  Result<void> loadConfig();

  /**
   * @brief Write the settings that differ from the base layer to
   * runtime_user.json
   */
  Result<void> saveUserConfig();

  [[nodiscard]] const RuntimeConfig& getConfig() const { return m_config; }
  RuntimeConfig& getConfigMutable() { return m_config; }

  void resetToDefaults();

  /**
   * @brief Drop user overrides, keeping the base layer
   */
  void resetUserSettings();

  void setOnConfigChanged(ConfigChangeCallback callback);
  void notifyConfigChanged();

  /**
   * @brief Create config/, the save directory and the log directory
   */
  Result<void> ensureDirectories();

  [[nodiscard]] const std::string& getBasePath() const { return m_basePath; }
  [[nodiscard]] std::string getConfigPath() const;
  [[nodiscard]] std::string getSavesPath() const;
  [[nodiscard]] std::string getLogsPath() const;

  // Convenience setters
  void setLogLevel(const std::string& level);
  void setTraceTransitions(bool enabled);
  void setStoryFile(const std::string& file);

  [[nodiscard]] static nlohmann::json toJson(const RuntimeConfig& config);

  /**
   * @brief Overlay the keys present in @p json onto @p config
   */
  static Result<void> applyJson(const nlohmann::json& json, RuntimeConfig& config);

private:
  Result<bool> loadLayer(const std::string& path);

  std::string m_basePath;
  RuntimeConfig m_config;
  RuntimeConfig m_baseConfig;
  ConfigChangeCallback m_onConfigChanged;
  bool m_initialized = false;
};

} // namespace Narrata::runtime
