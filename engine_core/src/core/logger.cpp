#include "Narrata/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace Narrata::core {

namespace {

const char* levelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

bool stderrIsTerminal() {
#ifdef _WIN32
  return false;
#else
  return isatty(fileno(stderr)) != 0;
#endif
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace")
    return LogLevel::Trace;
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "fatal")
    return LogLevel::Fatal;
  if (lower == "off")
    return LogLevel::Off;
  return std::nullopt;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_useColors(stderrIsTerminal()), m_consoleOutput(true),
      m_nextCallbackId(1) {}

Logger::~Logger() { closeOutputFile(); }

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  if (!m_fileStream.is_open()) {
    std::cerr << "[Logger] Failed to open log file: " << path << '\n';
  }
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleOutput = enabled;
}

Logger::CallbackId Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  CallbackId id = m_nextCallbackId++;
  m_callbacks.push_back({id, std::move(callback)});
  return id;
}

void Logger::removeLogCallback(CallbackId id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.erase(std::remove_if(m_callbacks.begin(), m_callbacks.end(),
                                   [id](const CallbackEntry& entry) { return entry.id == id; }),
                    m_callbacks.end());
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<CallbackEntry> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || level < m_level) {
      return;
    }

    std::string line = "[" + getCurrentTimestamp() + "] [" + logLevelName(level) + "] ";
    line.append(message);

    if (m_consoleOutput) {
      std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::clog;
      if (m_useColors) {
        out << levelColor(level) << line << "\033[0m\n";
      } else {
        out << line << '\n';
      }
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    callbacks = m_callbacks;
  }

  // Callbacks run unlocked so they may log or unregister themselves
  std::string text(message);
  for (const auto& entry : callbacks) {
    if (entry.callback) {
      entry.callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) { log(LogLevel::Trace, message); }

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }

void Logger::info(std::string_view message) { log(LogLevel::Info, message); }

void Logger::warning(std::string_view message) { log(LogLevel::Warning, message); }

void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::fatal(std::string_view message) { log(LogLevel::Fatal, message); }

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms.count();
  return oss.str();
}

} // namespace Narrata::core
