#pragma once

/**
 * @file story_launcher.hpp
 * @brief Story Launcher - entry point of the console story player
 *
 * The launcher:
 * - Parses command-line options
 * - Loads config/runtime_config.json and config/runtime_user.json
 * - Sets up logging from the logging section
 * - Loads and validates the story
 * - Plays it on the console, or only reports diagnostics with --validate
 */

#include "Narrata/core/result.hpp"
#include "Narrata/core/types.hpp"
#include "Narrata/dialogue/dialogue_director.hpp"
#include "Narrata/runtime/config_manager.hpp"
#include "Narrata/runtime/console_presenter.hpp"
#include "Narrata/runtime/game_session.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Narrata::runtime {

enum class LauncherState { Uninitialized, Initializing, Ready, Running, Error, ShuttingDown };

struct LauncherError {
  std::string code;
  std::string message;
  std::string details;
  std::string suggestion;

  [[nodiscard]] std::string format() const;
};

/**
 * @brief Command-line options
 */
struct LaunchOptions {
  std::string storyPath;        // Overrides story.file
  std::string configDir;        // Directory containing config/
  std::optional<i32> loadSlot;  // Resume from a save slot
  bool validateOnly = false;    // Report diagnostics and exit
  bool verbose = false;         // Debug logging and staging output
  bool help = false;
  bool version = false;
  std::vector<std::string> unknown;
};

using OnLauncherError = std::function<void(const LauncherError&)>;

class StoryLauncher : public dialogue::IDialogueListener {
public:
  StoryLauncher();
  ~StoryLauncher() override;

  StoryLauncher(const StoryLauncher&) = delete;
  StoryLauncher& operator=(const StoryLauncher&) = delete;

  Result<void> initialize(int argc, char* argv[]);
  Result<void> initialize(const LaunchOptions& options);

  /**
   * @brief Play the story, reading commands from @p in
   *
   * Commands: Enter or "n" continues, a number picks a choice,
   * "s <slot>" saves, "l <slot>" loads, "q" quits.
   * @return Exit code
   */
  i32 run(std::istream& in, std::ostream& out);

  /**
   * @brief Parse the story and print every diagnostic
   * @return 0 if the story loads, 1 otherwise
   */
  i32 validate(std::ostream& out);

  void showError(const LauncherError& error);
  void showError(const std::string& error);

  [[nodiscard]] LauncherState getState() const { return m_state; }
  [[nodiscard]] const LauncherError& getLastError() const { return m_lastError; }
  [[nodiscard]] const LaunchOptions& getOptions() const { return m_options; }
  [[nodiscard]] ConfigManager* getConfigManager() { return m_configManager.get(); }
  [[nodiscard]] GameSession* getSession() { return m_session.get(); }
  [[nodiscard]] std::string getStoryPath() const;

  void setOnError(OnLauncherError callback) { m_onError = std::move(callback); }

  static void printVersion(std::ostream& out);
  static void printHelp(std::ostream& out, const char* programName);
  [[nodiscard]] static LaunchOptions parseArgs(int argc, char* argv[]);

  // IDialogueListener
  void onDialogueEnded(const std::string& nodeId) override;
  void onStoryEnded() override;

private:
  Result<void> initializeConfig();
  Result<void> initializeLogging();
  Result<void> initializeSession();

  /**
   * @return false when the player asked to quit
   */
  bool handleCommand(const std::string& line, std::ostream& out);
  void settle();

  void setError(const std::string& code, const std::string& message,
                const std::string& details = "", const std::string& suggestion = "");

  LaunchOptions m_options;
  LauncherState m_state = LauncherState::Uninitialized;
  LauncherError m_lastError;
  std::string m_basePath;
  bool m_finished = false;

  std::unique_ptr<ConfigManager> m_configManager;
  std::unique_ptr<GameSession> m_session;
  std::unique_ptr<ConsolePresenter> m_presenter;

  OnLauncherError m_onError;
};

} // namespace Narrata::runtime
