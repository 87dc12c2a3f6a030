#include "wordbpe/logging.hpp"

#include <string>

namespace wordbpe {

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

void Logger::Write(LogLevel level, std::string_view message) const {
  if (!Enabled(level)) {
    return;
  }
  std::string line;
  line.reserve(message.size() + 10);
  line.push_back('[');
  line.append(LogLevelName(level));
  line.append("] ");
  line.append(message);
  line.push_back('\n');
  *out_ << line << std::flush;
}

}  // namespace wordbpe
