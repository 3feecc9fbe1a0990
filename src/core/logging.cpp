#include <sitescan/core/logging.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace sitescan::core {

namespace {

struct LoggingState {
  std::atomic<LogLevel> level{LogLevel::Info};
  std::atomic<bool> json{false};
  std::unique_ptr<std::ofstream> file;
  std::mutex mutex;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
    default:
      return "OFF";
  }
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
     << ms.count() << 'Z';
  return os.str();
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

bool Logger::enabled(LogLevel level) const noexcept {
  const LogLevel configured = state().level.load(std::memory_order_relaxed);
  return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(configured);
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& fields) const {
  if (!enabled(level)) return;

  auto& s = state();
  std::ostringstream line;
  if (s.json.load(std::memory_order_relaxed)) {
    line << "{\"ts\":\"" << timestamp() << "\",\"level\":\"" << level_name(level)
         << "\",\"logger\":\"" << name_ << "\",\"msg\":\"" << json_escape(message) << "\"";
    for (const auto& [key, value] : fields) {
      line << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
    }
    line << "}";
  } else {
    line << timestamp() << ' ' << level_name(level) << " [" << name_ << "] " << message;
    for (const auto& [key, value] : fields) {
      line << ' ' << key << '=' << value;
    }
  }

  std::lock_guard lock(s.mutex);
  std::ostream& out = s.file ? static_cast<std::ostream&>(*s.file) : std::cerr;
  out << line.str() << '\n';
  out.flush();
}

void Logger::debug(const std::string& message, const LogFields& fields) const {
  log(LogLevel::Debug, message, fields);
}

void Logger::info(const std::string& message, const LogFields& fields) const {
  log(LogLevel::Info, message, fields);
}

void Logger::warn(const std::string& message, const LogFields& fields) const {
  log(LogLevel::Warn, message, fields);
}

void Logger::error(const std::string& message, const LogFields& fields) const {
  log(LogLevel::Error, message, fields);
}

void configure_logging(const LoggingConfig& config) {
  auto& s = state();
  std::lock_guard lock(s.mutex);
  s.level.store(config.level);
  s.json.store(config.json);
  s.file.reset();
  if (config.log_file.has_value()) {
    auto file = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
    if (file->is_open()) {
      s.file = std::move(file);
    } else {
      std::cerr << "sitescan: cannot open log file " << *config.log_file
                << ", logging to stderr\n";
    }
  }
}

Logger get_logger(const std::string& name) {
  return Logger(name);
}

bool parse_log_level(const std::string& text, LogLevel& out) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") out = LogLevel::Debug;
  else if (upper == "INFO") out = LogLevel::Info;
  else if (upper == "WARN" || upper == "WARNING") out = LogLevel::Warn;
  else if (upper == "ERROR") out = LogLevel::Error;
  else if (upper == "OFF") out = LogLevel::Off;
  else return false;
  return true;
}

}  // namespace sitescan::core
