#ifndef REGBOT_LOGGER_H_
#define REGBOT_LOGGER_H_

#include <string>

namespace regbot {

enum LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to log file
  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();
  static void Log(LogLevel level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static LogLevel current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(LogLevel level);
};

} // namespace regbot

// LOG_DEBUG only compiles in debug builds
#ifdef REGBOT_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) regbot::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) regbot::Logger::Info(component, msg)
#define LOG_WARN(component, msg) regbot::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) regbot::Logger::Error(component, msg)

#endif  // REGBOT_LOGGER_H_
