#include "logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <functional>
#include <thread>
#include <fcntl.h>
#include <unistd.h>

namespace regbot {

#ifdef REGBOT_DEBUG_BUILD
LogLevel Logger::current_level_ = DEBUG;
#else
LogLevel Logger::current_level_ = INFO;
#endif

namespace {

std::mutex log_mutex;
std::string log_file_path;  // empty = stderr only

bool AppendToFile(const std::string& path, const std::string& line) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    return false;
  }
  ssize_t written = write(fd, line.data(), line.size());
  close(fd);
  return written == static_cast<ssize_t>(line.size());
}

// Short stable tag per thread, day workers log concurrently
std::string ThreadTag() {
  std::ostringstream oss;
  oss << std::hex << (std::hash<std::thread::id>()(std::this_thread::get_id()) & 0xFFFF);
  return oss.str();
}

}  // namespace

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path.clear();
}

void Logger::Init(const std::string& path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (!AppendToFile(path, "")) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << path << std::endl;
    log_file_path.clear();
    return;
  }
  log_file_path = path;
}

void Logger::SetLevel(LogLevel level) {
  current_level_ = level;
}

LogLevel Logger::GetLevel() {
  return current_level_;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(LogLevel level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(LogLevel level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::ostringstream line;
  line << '[' << GetTimestamp() << "] [" << LevelToString(level) << "] [" << ThreadTag()
       << "] [" << component << "] " << message << '\n';
  const std::string text = line.str();

  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << text;
  if (!log_file_path.empty()) {
    AppendToFile(log_file_path, text);  // stderr still has the line
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace regbot
