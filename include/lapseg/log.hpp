#pragma once
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lapseg {

enum class LogLevel : std::uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

const char* log_level_name(LogLevel lv);
std::optional<LogLevel> parse_log_level(const std::string& s);

struct LogRecord {
  std::uint64_t ts_ms = 0;   // wall clock, ms since epoch
  LogLevel level = LogLevel::Info;
  std::string tag;
  std::string msg;
};

struct LogSink {
  virtual ~LogSink() = default;
  virtual void write(const LogRecord& r) = 0;
};

class ConsoleSink final : public LogSink {
public:
  void write(const LogRecord& r) override;
};

// Appends to a file; silently inactive when the file cannot be opened.
class FileSink final : public LogSink {
public:
  explicit FileSink(const std::string& path);
  ~FileSink() override;
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  bool is_open() const { return fp_ != nullptr; }
  void write(const LogRecord& r) override;

private:
  std::FILE* fp_{nullptr};
};

// Process-wide synchronous logger. Safe to call from the polling and
// presentation threads.
class Logger {
public:
  static Logger& instance();

  void add_sink(std::shared_ptr<LogSink> sink);
  void clear_sinks();                    // also drops the console sink
  void set_console_enabled(bool enabled);

  void set_level(LogLevel lv) { level_.store(static_cast<std::uint8_t>(lv)); }
  LogLevel level() const { return static_cast<LogLevel>(level_.load()); }
  bool enabled(LogLevel lv) const { return lv != LogLevel::Off && lv >= level(); }

  void log(LogLevel lv, const std::string& tag, const std::string& msg);
#if defined(__GNUC__)
  __attribute__((format(printf, 4, 5)))
#endif
  void logf(LogLevel lv, const char* tag, const char* fmt, ...);

private:
  Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  std::atomic<std::uint8_t> level_{static_cast<std::uint8_t>(LogLevel::Info)};
  std::atomic<bool> console_enabled_{true};
  std::mutex mtx_;
  std::vector<std::shared_ptr<LogSink>> sinks_;
  std::shared_ptr<ConsoleSink> console_;
};

} // namespace lapseg

#define LAPSEG_LOGT(tag, ...) ::lapseg::Logger::instance().logf(::lapseg::LogLevel::Trace, (tag), __VA_ARGS__)
#define LAPSEG_LOGD(tag, ...) ::lapseg::Logger::instance().logf(::lapseg::LogLevel::Debug, (tag), __VA_ARGS__)
#define LAPSEG_LOGI(tag, ...) ::lapseg::Logger::instance().logf(::lapseg::LogLevel::Info, (tag), __VA_ARGS__)
#define LAPSEG_LOGW(tag, ...) ::lapseg::Logger::instance().logf(::lapseg::LogLevel::Warn, (tag), __VA_ARGS__)
#define LAPSEG_LOGE(tag, ...) ::lapseg::Logger::instance().logf(::lapseg::LogLevel::Error, (tag), __VA_ARGS__)
