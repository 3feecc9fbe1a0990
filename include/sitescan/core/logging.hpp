#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sitescan::core {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

struct LoggingConfig {
  LogLevel level{LogLevel::Info};
  bool json{false};
  std::optional<std::string> log_file;  // stderr when unset
};

/// Key/value pairs attached to one log line.
using LogFields = std::map<std::string, std::string>;

/// Named logger; cheap to copy. All loggers share the process-wide sink set by
/// configure_logging(). Thread-safe: lines are written whole under a mutex.
class Logger {
 public:
  explicit Logger(std::string name);

  void log(LogLevel level, const std::string& message, const LogFields& fields = {}) const;

  void debug(const std::string& message, const LogFields& fields = {}) const;
  void info(const std::string& message, const LogFields& fields = {}) const;
  void warn(const std::string& message, const LogFields& fields = {}) const;
  void error(const std::string& message, const LogFields& fields = {}) const;

  [[nodiscard]] bool enabled(LogLevel level) const noexcept;

 private:
  std::string name_;
};

void configure_logging(const LoggingConfig& config);

[[nodiscard]] Logger get_logger(const std::string& name);

/// Parses DEBUG/INFO/WARN/ERROR/OFF (case-insensitive); false if unknown.
bool parse_log_level(const std::string& text, LogLevel& out);

}  // namespace sitescan::core
