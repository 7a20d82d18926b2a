#include <lapseg/log.hpp>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <ctime>

namespace lapseg {

namespace {

std::uint64_t now_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
    duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

void format_line(std::FILE* fp, const LogRecord& r) {
  const std::time_t secs = static_cast<std::time_t>(r.ts_ms / 1000);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &secs);
#else
  localtime_r(&secs, &tm);
#endif
  char hms[16];
  std::strftime(hms, sizeof(hms), "%H:%M:%S", &tm);
  std::fprintf(fp, "[%s.%03u] %-5s %-10s %s\n", hms,
               static_cast<unsigned>(r.ts_ms % 1000),
               log_level_name(r.level), r.tag.c_str(), r.msg.c_str());
  std::fflush(fp);
}

} // namespace

const char* log_level_name(LogLevel lv) {
  switch (lv) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
  std::string t;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (t == "trace") return LogLevel::Trace;
  if (t == "debug") return LogLevel::Debug;
  if (t == "info")  return LogLevel::Info;
  if (t == "warn" || t == "warning") return LogLevel::Warn;
  if (t == "error") return LogLevel::Error;
  if (t == "off")   return LogLevel::Off;
  return std::nullopt;
}

void ConsoleSink::write(const LogRecord& r) {
  format_line(stderr, r);
}

FileSink::FileSink(const std::string& path) {
  fp_ = std::fopen(path.c_str(), "a");
}

FileSink::~FileSink() {
  if (fp_) std::fclose(fp_);
}

void FileSink::write(const LogRecord& r) {
  if (!fp_) return;
  format_line(fp_, r);
}

Logger& Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::Logger() : console_(std::make_shared<ConsoleSink>()) {}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lk(mtx_);
  sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
  std::lock_guard<std::mutex> lk(mtx_);
  sinks_.clear();
  console_enabled_.store(false);
}

void Logger::set_console_enabled(bool enabled) {
  console_enabled_.store(enabled);
}

void Logger::log(LogLevel lv, const std::string& tag, const std::string& msg) {
  if (!enabled(lv)) return;
  LogRecord r{now_ms(), lv, tag, msg};
  std::lock_guard<std::mutex> lk(mtx_);
  if (console_enabled_.load()) console_->write(r);
  for (auto& s : sinks_) s->write(r);
}

void Logger::logf(LogLevel lv, const char* tag, const char* fmt, ...) {
  if (!enabled(lv)) return;
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  log(lv, tag ? tag : "", buf);
}

} // namespace lapseg
