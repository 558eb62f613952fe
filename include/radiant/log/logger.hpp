#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace radiant::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

inline std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

/// @brief Parse a level name ("debug", "info", "warn", "error", "off")
inline std::optional<Level> parse_level(std::string_view name) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  return std::nullopt;
}

/// @brief Process-wide stderr logger
///
/// The initial level comes from RADIANT_LOG_LEVEL when it names a valid
/// level, otherwise info.
class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) { level_.store(lv, std::memory_order_relaxed); }

  /// @return false (level unchanged) when `name` is not a level name
  bool set_level(std::string_view name) {
    if (auto lv = parse_level(name)) {
      set_level(*lv);
      return true;
    }
    return false;
  }

  Level level() const { return level_.load(std::memory_order_relaxed); }

  bool enabled(Level lv) const { return lv >= level(); }

  template <class... Args>
  void log(Level lv, std::string_view fmt, Args &&...args) {
    if (!enabled(lv))
      return;
    write_line(lv, std::vformat(fmt, std::make_format_args(args...)));
  }

private:
  Logger() {
    if (const char *env = std::getenv("RADIANT_LOG_LEVEL"))
      set_level(std::string_view(env));
  }

  std::atomic<Level> level_{Level::info};
  std::mutex mu_;

  void write_line(Level lv, const std::string &body) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char tbuf[9];
    std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

    const std::string line = std::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
};

#define RLOG_AT(lv, ...) ::radiant::log::Logger::instance().log(::radiant::log::Level::lv, __VA_ARGS__)

#define RLOG_DEBUG(...) RLOG_AT(debug, __VA_ARGS__)
#define RLOG_INFO(...) RLOG_AT(info, __VA_ARGS__)
#define RLOG_WARN(...) RLOG_AT(warn, __VA_ARGS__)
#define RLOG_ERROR(...) RLOG_AT(error, __VA_ARGS__)

} // namespace radiant::log
