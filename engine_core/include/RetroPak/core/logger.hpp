#pragma once

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace RetroPak::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

[[nodiscard]] const char* logLevelToString(LogLevel level);
[[nodiscard]] bool logLevelFromString(std::string_view text, LogLevel& out);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setOutputFile(const std::string& path);
  void closeOutputFile();

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  std::vector<LogCallback> m_callbacks;
};

} // namespace RetroPak::core

#define RETROPAK_LOG_TRACE(...) ::RetroPak::core::Logger::instance().trace(__VA_ARGS__)
#define RETROPAK_LOG_DEBUG(...) ::RetroPak::core::Logger::instance().debug(__VA_ARGS__)
#define RETROPAK_LOG_INFO(...) ::RetroPak::core::Logger::instance().info(__VA_ARGS__)
#define RETROPAK_LOG_WARN(...) ::RetroPak::core::Logger::instance().warning(__VA_ARGS__)
#define RETROPAK_LOG_ERROR(...) ::RetroPak::core::Logger::instance().error(__VA_ARGS__)
#define RETROPAK_LOG_FATAL(...) ::RetroPak::core::Logger::instance().fatal(__VA_ARGS__)
