#pragma once

#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace EvflEditor::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 * "fatal", "off"), case-insensitive
 */
[[nodiscard]] std::optional<LogLevel> logLevelFromString(std::string_view name);
[[nodiscard]] const char* logLevelToString(LogLevel level);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  /**
   * @brief Mirror log output to a file (appending)
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  void setConsoleOutput(bool enabled);

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

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleOutput = true;
  std::vector<LogCallback> m_callbacks;
};

} // namespace EvflEditor::core

#define EVFLEDITOR_LOG_TRACE(...) ::EvflEditor::core::Logger::instance().trace(__VA_ARGS__)
#define EVFLEDITOR_LOG_DEBUG(...) ::EvflEditor::core::Logger::instance().debug(__VA_ARGS__)
#define EVFLEDITOR_LOG_INFO(...) ::EvflEditor::core::Logger::instance().info(__VA_ARGS__)
#define EVFLEDITOR_LOG_WARN(...) ::EvflEditor::core::Logger::instance().warning(__VA_ARGS__)
#define EVFLEDITOR_LOG_ERROR(...) ::EvflEditor::core::Logger::instance().error(__VA_ARGS__)
#define EVFLEDITOR_LOG_FATAL(...) ::EvflEditor::core::Logger::instance().fatal(__VA_ARGS__)
