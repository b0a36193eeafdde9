/**
 * @file story_launcher.cpp
 * @brief Story Launcher implementation
 */

#include "Narrata/runtime/story_launcher.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/story/story_parser.hpp"
#include "Narrata/story/story_validator.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace Narrata::runtime {

std::string LauncherError::format() const {
  std::string result = "[" + code + "] " + message;
  if (!details.empty()) {
    result += "\nDetails: " + details;
  }
  if (!suggestion.empty()) {
    result += "\nSuggestion: " + suggestion;
  }
  return result;
}

StoryLauncher::StoryLauncher() = default;

StoryLauncher::~StoryLauncher() {
  if (m_session) {
    m_session->getDirector().removeListener(this);
  }
}

Result<void> StoryLauncher::initialize(int argc, char* argv[]) {
  m_options = parseArgs(argc, argv);

  if (m_options.help) {
    printHelp(std::cout, argv[0]);
    m_state = LauncherState::Ready;
    return Result<void>::ok();
  }

  if (m_options.version) {
    printVersion(std::cout);
    m_state = LauncherState::Ready;
    return Result<void>::ok();
  }

  return initialize(m_options);
}

Result<void> StoryLauncher::initialize(const LaunchOptions& options) {
  m_state = LauncherState::Initializing;
  m_options = options;

  for (const auto& arg : m_options.unknown) {
    NARRATA_LOG_WARN("Ignoring unknown option '{}'", arg);
  }

  try {
    m_basePath = m_options.configDir.empty() ? fs::current_path().string() : m_options.configDir;
  } catch (const fs::filesystem_error& e) {
    setError("INIT_PATH", "Cannot determine working directory", e.what());
    return Result<void>::error(e.what());
  }
  if (!m_basePath.empty() && m_basePath.back() != '/' && m_basePath.back() != '\\') {
    m_basePath += '/';
  }

  auto result = initializeConfig();
  if (result.isError()) {
    setError("INIT_CONFIG", "Failed to load configuration", result.error(),
             "Check that config/runtime_config.json is valid JSON");
    return result;
  }

  result = initializeLogging();
  if (result.isError()) {
    setError("INIT_LOG", "Failed to initialize logging", result.error(),
             "Check write permissions in the logs directory");
    return result;
  }

  if (m_options.validateOnly) {
    m_state = LauncherState::Ready;
    return Result<void>::ok();
  }

  result = initializeSession();
  if (result.isError()) {
    setError("INIT_STORY", "Failed to load story", result.error(),
             "Run with --validate to list every problem in the story file");
    return result;
  }

  m_state = LauncherState::Ready;
  NARRATA_LOG_INFO("Story launcher initialized");
  return Result<void>::ok();
}

Result<void> StoryLauncher::initializeConfig() {
  m_configManager = std::make_unique<ConfigManager>();

  auto result = m_configManager->initialize(m_basePath);
  if (result.isError()) {
    return result;
  }

  result = m_configManager->loadConfig();
  if (result.isError()) {
    return result;
  }

  if (!m_options.storyPath.empty()) {
    m_configManager->setStoryFile(m_options.storyPath);
  }
  if (m_options.verbose) {
    m_configManager->setLogLevel("debug");
  }

  return m_configManager->ensureDirectories();
}

Result<void> StoryLauncher::initializeLogging() {
  auto& logger = core::Logger::instance();
  const auto& logging = m_configManager->getConfig().logging;

  logger.setLevel(core::parseLogLevel(logging.logLevel).value_or(core::LogLevel::Info));
  logger.setConsoleOutput(logging.logToConsole);

  if (logging.logToFile) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char timeStr[64];
    std::strftime(timeStr, sizeof(timeStr), "%Y%m%d_%H%M%S", std::localtime(&time));

    std::string logFile = m_configManager->getLogsPath() + "narrata_" + timeStr + ".log";
    logger.setOutputFile(logFile);
    NARRATA_LOG_INFO("Logging to {}", logFile);
  }

  return Result<void>::ok();
}

std::string StoryLauncher::getStoryPath() const {
  if (!m_configManager) {
    return m_options.storyPath;
  }
  fs::path path(m_configManager->getConfig().story.file);
  if (path.is_relative() && m_options.storyPath.empty()) {
    path = fs::path(m_basePath) / path;
  }
  return path.string();
}

Result<void> StoryLauncher::initializeSession() {
  RuntimeConfig config = m_configManager->getConfig();
  config.saves.saveDirectory = m_configManager->getSavesPath();
  if (m_options.verbose) {
    config.debug.traceTransitions = true;
  }

  m_session = std::make_unique<GameSession>(config);
  m_session->getDirector().addListener(this);

  const std::string path = getStoryPath();
  auto loaded = m_session->loadStoryFile(path);
  if (loaded.isError()) {
    return Result<void>::error(loaded.error().format());
  }

  NARRATA_LOG_INFO("Loaded story '{}' from {}", m_session->getStoryManager().getStory()->title,
                   path);
  return Result<void>::ok();
}

i32 StoryLauncher::validate(std::ostream& out) {
  const std::string path = getStoryPath();
  auto parsed = story::StoryParser::parseFile(path);
  if (parsed.isError()) {
    out << path << ": " << parsed.error().format() << "\n";
    return 1;
  }

  const story::Story& story = parsed.value();
  out << path << ": story '" << story.id << "' (" << story.nodes.size() << " nodes) is valid\n";

  usize warnings = 0;
  for (const auto& id : story::StoryValidator::findUnreachableNodes(story)) {
    out << "  warning: node '" << id << "' is unreachable from '" << story.startNode << "'\n";
    ++warnings;
  }
  for (const auto& cycle : story::StoryValidator::findAutoProgressCycles(story)) {
    out << "  warning: nodes may auto-progress forever:";
    for (const auto& id : cycle) {
      out << " " << id;
    }
    out << "\n";
    ++warnings;
  }
  for (const auto& diagnostic : story::StoryValidator::findScriptErrors(story)) {
    out << "  warning: node '" << diagnostic.nodeId << "' " << diagnostic.field << ": "
        << diagnostic.message << "\n";
    ++warnings;
  }

  out << warnings << " warning(s)\n";
  return 0;
}

void StoryLauncher::onDialogueEnded(const std::string& nodeId) {
  NARRATA_LOG_INFO("Dialogue ended at node '{}'", nodeId);
  m_finished = true;
}

void StoryLauncher::onStoryEnded() { m_finished = true; }

void StoryLauncher::settle() {
  // The console shows text at once, so typing is complete as soon as it is shown
  m_session->update();
  m_session->getDirector().onTypingComplete();
}

i32 StoryLauncher::run(std::istream& in, std::ostream& out) {
  if (m_state != LauncherState::Ready) {
    NARRATA_LOG_ERROR("Cannot run: launcher not in Ready state");
    return 1;
  }

  if (m_options.help || m_options.version) {
    return 0;
  }

  if (m_options.validateOnly) {
    return validate(out);
  }

  m_state = LauncherState::Running;
  m_finished = false;

  m_presenter = std::make_unique<ConsolePresenter>(out);
  m_presenter->setShowStaging(m_options.verbose);
  m_session->getDirector().setCharacterPresenter(m_presenter.get());
  m_session->getDirector().setDialoguePresenter(m_presenter.get());

  const story::Story* story = m_session->getStoryManager().getStory();
  out << "== " << story->title << " ==\n";

  if (m_options.loadSlot) {
    auto loaded = m_session->loadFromSlot(*m_options.loadSlot);
    if (loaded.isError()) {
      setError("LOAD_SLOT", "Failed to load save slot " + std::to_string(*m_options.loadSlot),
               loaded.error());
      m_state = LauncherState::Error;
      return 1;
    }
  } else {
    auto started = m_session->start();
    if (started.isError()) {
      setError("START", "Failed to start story", started.error().format());
      m_state = LauncherState::Error;
      return 1;
    }
  }
  settle();

  std::string line;
  while (!m_finished) {
    out << "> " << std::flush;
    if (!std::getline(in, line)) {
      break;
    }
    if (!handleCommand(line, out)) {
      break;
    }
    settle();
  }

  if (m_finished) {
    out << "\n== The End ==\n";
  }

  m_session->getDirector().setCharacterPresenter(nullptr);
  m_session->getDirector().setDialoguePresenter(nullptr);
  m_state = LauncherState::ShuttingDown;
  return 0;
}

bool StoryLauncher::handleCommand(const std::string& line, std::ostream& out) {
  std::istringstream stream(line);
  std::string command;
  stream >> command;

  auto& director = m_session->getDirector();

  if (command.empty() || command == "n") {
    if (director.isAwaitingChoice()) {
      out << "Pick a choice by number.\n";
      return true;
    }
    auto result = director.continueDialogue();
    if (result.isError()) {
      out << result.error().format() << "\n";
    }
    return true;
  }

  if (command == "q") {
    return false;
  }

  if (command == "s" || command == "l") {
    i32 slot = 0;
    if (!(stream >> slot)) {
      out << "Usage: " << command << " <slot>\n";
      return true;
    }
    if (command == "s") {
      auto saved = m_session->saveToSlot(slot, "Slot " + std::to_string(slot));
      out << (saved.isOk() ? "Saved to slot " + std::to_string(slot) : saved.error()) << "\n";
    } else {
      m_finished = false;
      auto loaded = m_session->loadFromSlot(slot);
      out << (loaded.isOk() ? "Loaded slot " + std::to_string(slot) : loaded.error()) << "\n";
    }
    return true;
  }

  if (command == "h" || command == "?") {
    out << "Enter/n: continue, <number>: choose, s <slot>: save, l <slot>: load, q: quit\n";
    return true;
  }

  i32 choice = 0;
  std::istringstream number(command);
  if (number >> choice && number.eof()) {
    auto result = director.selectChoice(choice - 1);
    if (result.isError()) {
      out << result.error().format() << "\n";
    }
    return true;
  }

  out << "Unknown command '" << command << "' (h for help)\n";
  return true;
}

void StoryLauncher::showError(const LauncherError& error) {
  m_lastError = error;
  NARRATA_LOG_ERROR("{}", error.format());

  std::cerr << "\n=== Error ===\n";
  std::cerr << error.format() << "\n";
  std::cerr << "=============\n\n";

  if (m_onError) {
    m_onError(error);
  }
}

void StoryLauncher::showError(const std::string& error) {
  if (!m_lastError.code.empty() && m_lastError.details == error) {
    showError(m_lastError);
    return;
  }
  LauncherError err;
  err.code = "ERROR";
  err.message = error;
  showError(err);
}

void StoryLauncher::setError(const std::string& code, const std::string& message,
                             const std::string& details, const std::string& suggestion) {
  m_state = LauncherState::Error;
  m_lastError = {code, message, details, suggestion};
}

void StoryLauncher::printVersion(std::ostream& out) {
  out << "narrata_player version " << NARRATA_VERSION_MAJOR << "." << NARRATA_VERSION_MINOR
      << "." << NARRATA_VERSION_PATCH << "\n";
  out << "Branching story player\n";
}

void StoryLauncher::printHelp(std::ostream& out, const char* programName) {
  out << "Usage: " << programName << " [options]\n\n";
  out << "Play a branching story on the console.\n\n";
  out << "Options:\n";
  out << "  --story <file>    Story file (.yaml, .yml or .json)\n";
  out << "  --config <dir>    Directory containing config/\n";
  out << "  --validate        Check the story and list diagnostics\n";
  out << "  --load <slot>     Resume from a save slot\n";
  out << "  --verbose         Debug logging and character staging output\n";
  out << "  -h, --help        Show this help message\n";
  out << "  --version         Show version information\n\n";
  out << "Configuration is read from:\n";
  out << "  config/runtime_config.json - Story settings\n";
  out << "  config/runtime_user.json   - User preferences\n";
}

LaunchOptions StoryLauncher::parseArgs(int argc, char* argv[]) {
  LaunchOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--story" && i + 1 < argc) {
      opts.storyPath = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      opts.configDir = argv[++i];
    } else if (arg == "--load" && i + 1 < argc) {
      std::istringstream slot(argv[++i]);
      i32 value = 0;
      if (slot >> value) {
        opts.loadSlot = value;
      } else {
        opts.unknown.push_back(std::string("--load ") + argv[i]);
      }
    } else if (arg == "--validate") {
      opts.validateOnly = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else {
      opts.unknown.push_back(arg);
    }
  }

  return opts;
}

} // namespace Narrata::runtime
