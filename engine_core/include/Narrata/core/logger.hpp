#pragma once

#include "Narrata/core/types.hpp"
#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Narrata::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 * "error", "fatal", "off"), case-insensitive
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

[[nodiscard]] const char* logLevelName(LogLevel level);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setOutputFile(const std::string& path);
  void closeOutputFile();

  /**
   * @brief Enable or disable writing to stderr/stdout
   *
   * File output and callbacks are unaffected.
   */
  void setConsoleOutput(bool enabled);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  using CallbackId = u32;

  /**
   * @brief Register a callback invoked for every emitted message
   * @return Handle for removeLogCallback()
   */
  CallbackId addLogCallback(LogCallback callback);
  void removeLogCallback(CallbackId id);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    trace(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    debug(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    info(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    warning(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    error(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    fatal(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  struct CallbackEntry {
    CallbackId id;
    LogCallback callback;
  };

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleOutput;
  CallbackId m_nextCallbackId;
  std::vector<CallbackEntry> m_callbacks;
};

} // namespace Narrata::core

#define NARRATA_LOG_TRACE(...) ::Narrata::core::Logger::instance().trace(__VA_ARGS__)
#define NARRATA_LOG_DEBUG(...) ::Narrata::core::Logger::instance().debug(__VA_ARGS__)
#define NARRATA_LOG_INFO(...) ::Narrata::core::Logger::instance().info(__VA_ARGS__)
#define NARRATA_LOG_WARN(...) ::Narrata::core::Logger::instance().warning(__VA_ARGS__)
#define NARRATA_LOG_ERROR(...) ::Narrata::core::Logger::instance().error(__VA_ARGS__)
#define NARRATA_LOG_FATAL(...) ::Narrata::core::Logger::instance().fatal(__VA_ARGS__)
