/**
 * @file logger.cpp
 * @brief Process-wide logger implementation
 */

#include "RetroPak/core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace RetroPak::core {

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
  case LogLevel::Fatal:
    return "\033[31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

constexpr const char* COLOR_RESET = "\033[0m";

} // namespace

const char* logLevelToString(LogLevel level) {
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

bool logLevelFromString(std::string_view text, LogLevel& out) {
  if (text == "trace" || text == "TRACE") {
    out = LogLevel::Trace;
  } else if (text == "debug" || text == "DEBUG") {
    out = LogLevel::Debug;
  } else if (text == "info" || text == "INFO") {
    out = LogLevel::Info;
  } else if (text == "warning" || text == "warn" || text == "WARN") {
    out = LogLevel::Warning;
  } else if (text == "error" || text == "ERROR") {
    out = LogLevel::Error;
  } else if (text == "fatal" || text == "FATAL") {
    out = LogLevel::Fatal;
  } else if (text == "off" || text == "OFF") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : m_level(LogLevel::Info), m_useColors(false) {
#ifndef _WIN32
  m_useColors = isatty(fileno(stderr)) != 0;
#endif
}

Logger::~Logger() {
  closeOutputFile();
}

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
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  const std::string text(message);
  std::vector<LogCallback> callbacks;

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level || level == LogLevel::Off) {
      return;
    }

    const std::string timestamp = getCurrentTimestamp();

    if (m_useColors) {
      std::cerr << levelColor(level) << "[" << timestamp << "] [" << logLevelToString(level)
                << "] " << COLOR_RESET << text << '\n';
    } else {
      std::cerr << "[" << timestamp << "] [" << logLevelToString(level) << "] " << text << '\n';
    }

    if (m_fileStream.is_open()) {
      m_fileStream << "[" << timestamp << "] [" << logLevelToString(level) << "] " << text
                   << '\n';
      m_fileStream.flush();
    }

    callbacks = m_callbacks;
  }

  // Callbacks run without the lock held
  for (const auto& callback : callbacks) {
    if (callback) {
      callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

std::string Logger::getCurrentTimestamp() const {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
  char withMillis[40];
  std::snprintf(withMillis, sizeof(withMillis), "%s.%03d", buffer, static_cast<int>(millis));
  return withMillis;
}

} // namespace RetroPak::core
