#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace sps::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error on an unknown level name.
LogLevel ParseLogLevel(const std::string& value);

// Process-wide sink. Messages at or above the console threshold go to stderr
// as "[component] level: message"; when a debug log file is enabled, messages
// at or above the file threshold are appended there with a timestamp, and the
// file is rotated once it exceeds the configured size.
class DebugLogger {
 public:
  void Enable(const std::string& path);
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void SetConsoleThreshold(LogLevel level);
  void Log(LogLevel level, std::string_view component, const std::string& message);
  bool Enabled() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kDebug};
  LogLevel console_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

DebugLogger& Logger();

inline void LogDebug(std::string_view component, const std::string& message) {
  Logger().Log(LogLevel::kDebug, component, message);
}
inline void LogInfo(std::string_view component, const std::string& message) {
  Logger().Log(LogLevel::kInfo, component, message);
}
inline void LogWarn(std::string_view component, const std::string& message) {
  Logger().Log(LogLevel::kWarn, component, message);
}
inline void LogError(std::string_view component, const std::string& message) {
  Logger().Log(LogLevel::kError, component, message);
}

}  // namespace sps::util
