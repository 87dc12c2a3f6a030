#pragma once

#include <ostream>
#include <sstream>
#include <string_view>

namespace wordbpe {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

[[nodiscard]] std::string_view LogLevelName(LogLevel level);

// Line-oriented logger over a caller-owned stream. A default-constructed
// Logger has no stream and drops everything.
class Logger {
 public:
  Logger() = default;
  explicit Logger(std::ostream& out, LogLevel min_level = LogLevel::kInfo) : out_(&out), min_level_(min_level) {}

  [[nodiscard]] bool Enabled(LogLevel level) const { return out_ != nullptr && level >= min_level_; }
  void SetMinLevel(LogLevel level) { min_level_ = level; }

  void Write(LogLevel level, std::string_view message) const;

  template <typename... Args>
  void Debug(const Args&... args) const {
    Format(LogLevel::kDebug, args...);
  }
  template <typename... Args>
  void Info(const Args&... args) const {
    Format(LogLevel::kInfo, args...);
  }
  template <typename... Args>
  void Warn(const Args&... args) const {
    Format(LogLevel::kWarn, args...);
  }
  template <typename... Args>
  void Error(const Args&... args) const {
    Format(LogLevel::kError, args...);
  }

 private:
  template <typename... Args>
  void Format(LogLevel level, const Args&... args) const {
    if (!Enabled(level)) {
      return;
    }
    std::ostringstream line;
    (line << ... << args);
    Write(level, line.str());
  }

  std::ostream* out_ = nullptr;
  LogLevel min_level_ = LogLevel::kInfo;
};

}  // namespace wordbpe
