#pragma once

/**
 * @file runtime_config.hpp
 * @brief Runtime Configuration - Settings for the story player
 *
 * Provides runtime configuration for:
 * - Game metadata (name, version)
 * - Story source (file, format, load-time checks)
 * - Character staging (action durations, emote heuristics)
 * - Save slots (directory, slot count, format version)
 * - Logging settings (level, file output)
 * - Debug switches
 */

#include "Narrata/core/types.hpp"
#include <string>

namespace Narrata::runtime {

struct GameInfo {
  std::string name = "Narrata Story";
  std::string version = "1.0.0";
};

/**
 * @brief Story source section
 */
struct StorySettings {
  std::string file = "story.yaml";
  std::string format;          // "json", "yaml" or empty to infer from the extension
  bool validateOnLoad = true;  // Log diagnostics after loading
  bool warnUnreachable = true; // Include unreachable-node warnings in those diagnostics
};

/**
 * @brief Character staging section
 */
struct CharacterSettings {
  f64 enterDuration = 0.8; // Seconds
  f64 exitDuration = 0.7;
  f64 moveDuration = 0.5;
  f64 emoteBaseline = 0.3; // Probability of an unprompted emote
  u32 randomSeed = 0;      // 0 = nondeterministic
};

struct SaveSettings {
  std::string saveDirectory = "saves";
  i32 maxSlots = 100;
  i32 formatVersion = 1;
  bool autoSaveEnabled = true;
};

struct LoggingSettings {
  std::string logLevel = "info"; // trace, debug, info, warning, error, fatal, off
  std::string logDirectory = "logs";
  bool logToFile = false;
  bool logToConsole = true;
};

struct DebugSettings {
  bool traceTransitions = false;
};

/**
 * @brief Complete runtime configuration
 *
 * Loaded from config/runtime_config.json with user overrides from
 * config/runtime_user.json.
 */
struct RuntimeConfig {
  std::string version = "1.0";

  GameInfo game;
  StorySettings story;
  CharacterSettings characters;
  SaveSettings saves;
  LoggingSettings logging;
  DebugSettings debug;
};

} // namespace Narrata::runtime
