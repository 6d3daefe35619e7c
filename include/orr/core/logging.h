#pragma once
// orr/core/logging.h
//
// Lightweight logging for batch runs (no fmt dependency).
// Usage:
//   ORR_LOG_INFO("processed", n_files, "files");
//   orr::Logger::Instance().SetLevel(orr::LogLevel::Debug);
//
// By default logs go to stderr.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace orr {

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5,
};

inline constexpr std::string_view ToString(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

inline bool ParseLogLevel(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  auto eq = [](std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
      const char x = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
      if (x != b[i]) return false;
    }
    return true;
  };
  if (eq(s, "trace")) { *out = LogLevel::Trace; return true; }
  if (eq(s, "debug")) { *out = LogLevel::Debug; return true; }
  if (eq(s, "info")) { *out = LogLevel::Info; return true; }
  if (eq(s, "warn") || eq(s, "warning")) { *out = LogLevel::Warn; return true; }
  if (eq(s, "error")) { *out = LogLevel::Error; return true; }
  if (eq(s, "off")) { *out = LogLevel::Off; return true; }
  return false;
}

struct LoggingConfig {
  LogLevel level = LogLevel::Info;
  bool with_timestamp = true;
  bool with_thread_id = false;
};

namespace detail {

inline std::tm LocalTime(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

template <class... Args>
inline void AppendSpaceSeparated(std::ostringstream& oss, Args&&... args) {
  bool first = true;
  auto append_one = [&](auto&& v) {
    if (!first) oss << ' ';
    first = false;
    oss << std::forward<decltype(v)>(v);
  };
  (append_one(std::forward<Args>(args)), ...);
}

}  // namespace detail

class Logger {
 public:
  static Logger& Instance() {
    static Logger inst;
    return inst;
  }

  void SetConfig(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
    level_.store(cfg.level, std::memory_order_relaxed);
  }

  void SetLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }

  LogLevel Level() const { return level_.load(std::memory_order_relaxed); }

  // Set output stream (default: &std::cerr). Caller owns the stream.
  // Returns the previous stream.
  std::ostream* SetOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostream* prev = out_;
    out_ = out ? out : &std::cerr;
    return prev;
  }

  template <class... Args>
  void Log(LogLevel lvl, Args&&... args) {
    const LogLevel cur = level_.load(std::memory_order_relaxed);
    if (lvl < cur || cur == LogLevel::Off) return;

    std::ostringstream oss;
    std::lock_guard<std::mutex> lk(mu_);  // workers log concurrently during file loading

    if (cfg_.with_timestamp) {
      using clock = std::chrono::system_clock;
      const auto now = clock::now();
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

      const std::time_t t = clock::to_time_t(now);
      const std::tm tm = detail::LocalTime(t);

      oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
          << '.' << std::setfill('0') << std::setw(3) << ms.count()
          << ' ';
    }

    oss << '[' << ToString(lvl) << ']';

    if (cfg_.with_thread_id) {
      oss << "[tid=" << std::this_thread::get_id() << ']';
    }

    oss << ' ';
    detail::AppendSpaceSeparated(oss, std::forward<Args>(args)...);
    oss << '\n';

    (*out_) << oss.str() << std::flush;
  }

 private:
  Logger() : level_(LogLevel::Info), cfg_{}, out_(&std::cerr) {}

  std::atomic<LogLevel> level_;
  LoggingConfig cfg_;
  std::ostream* out_;
  mutable std::mutex mu_;
};

// Redirects log output (and optionally the level) for the lifetime of the
// object; restores both on destruction. Used by tests and by tools that want
// to collect per-file warnings.
class ScopedLogCapture {
 public:
  explicit ScopedLogCapture(std::ostream* out, LogLevel lvl = LogLevel::Trace)
      : prev_out_(Logger::Instance().SetOutput(out)), prev_level_(Logger::Instance().Level()) {
    Logger::Instance().SetLevel(lvl);
  }

  ScopedLogCapture(const ScopedLogCapture&) = delete;
  ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

  ~ScopedLogCapture() {
    Logger::Instance().SetOutput(prev_out_);
    Logger::Instance().SetLevel(prev_level_);
  }

 private:
  std::ostream* prev_out_;
  LogLevel prev_level_;
};

// Convenience macros
#define ORR_LOG_TRACE(...) ::orr::Logger::Instance().Log(::orr::LogLevel::Trace, __VA_ARGS__)
#define ORR_LOG_DEBUG(...) ::orr::Logger::Instance().Log(::orr::LogLevel::Debug, __VA_ARGS__)
#define ORR_LOG_INFO(...)  ::orr::Logger::Instance().Log(::orr::LogLevel::Info,  __VA_ARGS__)
#define ORR_LOG_WARN(...)  ::orr::Logger::Instance().Log(::orr::LogLevel::Warn,  __VA_ARGS__)
#define ORR_LOG_ERROR(...) ::orr::Logger::Instance().Log(::orr::LogLevel::Error, __VA_ARGS__)

}  // namespace orr
