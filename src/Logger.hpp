#pragma once

#include <chrono>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

inline std::optional<Level> ParseLevel(const std::string& s) {
  if (s == "debug")
    return Level::Debug;
  if (s == "info")
    return Level::Info;
  if (s == "warning" || s == "warn")
    return Level::Warning;
  if (s == "error")
    return Level::Error;
  if (s == "none" || s == "off")
    return Level::None;
  return std::nullopt;
}

// $HOME/.config/pdfcache/logging.json sets the base level,
// $PDFCACHE_LOG_LEVEL overrides it. Resolved once per process.
inline Level CurrentLevel() {
  static Level lvl = [] {
    Level base = Level::Info;
    if (auto* home = std::getenv("HOME")) {
      std::ifstream in{std::string(home) + "/.config/pdfcache/logging.json"};
      if (in) {
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (!j.is_discarded()) {
          if (auto it = j.find("level"); it != j.end() && it->is_string()) {
            if (auto parsed = ParseLevel(it->get<std::string>()))
              base = *parsed;
          }
        }
      }
    }
    if (auto* env = std::getenv("PDFCACHE_LOG_LEVEL")) {
      if (auto parsed = ParseLevel(env))
        base = *parsed;
    }
    return base;
  }();
  return lvl;
}

// returns true if a message at level `msg` should be suppressed
inline bool ShouldMute(Level msg) {
  return msg == Level::None || msg < CurrentLevel();
}

inline bool is_tty() {
  return ::isatty(::fileno(stderr)) != 0;
}

// ANSI escape sequences
static constexpr char const* RESET = "\033[0m";
static constexpr char const* CYAN = "\033[36m";
static constexpr char const* GREEN = "\033[32m";
static constexpr char const* YELLOW = "\033[33m";
static constexpr char const* RED = "\033[31m";

inline constexpr char const* colorCode(Level L) {
  switch (L) {
    case Level::Debug:
      return CYAN;
    case Level::Info:
      return GREEN;
    case Level::Warning:
      return YELLOW;
    case Level::Error:
      return RED;
    default:
      return RESET;
  }
}

inline constexpr char const* levelTag(Level L) {
  switch (L) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO ";
    case Level::Warning:
      return "WARN ";
    case Level::Error:
      return "ERROR";
    default:
      return "";
  }
}

// "2026-10-19T16:28:03Z"
inline std::string utcTimestamp() {
  std::time_t t =
    std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

// RAII proxy: prefix in ctor, newline in dtor, holds the lock in between so
// concurrent entries never interleave.
class LogEntry {
 public:
  LogEntry(Level L) : lvl(L), muted(ShouldMute(L)), lock(log_mutex()) {
    if (!muted) {
      if (is_tty()) {
        std::cerr << colorCode(lvl);
      }
      std::cerr << utcTimestamp() << ' ' << levelTag(lvl) << ' ';
    }
  }

  ~LogEntry() {
    if (!muted) {
      if (is_tty()) {
        std::cerr << RESET;
      }
      std::cerr << std::endl;
    }
  }

  // a moved-from entry must not emit its own newline
  LogEntry(LogEntry&& other) noexcept
      : lvl(other.lvl), muted(other.muted), lock(std::move(other.lock)) {
    other.muted = true;
  }
  LogEntry& operator=(LogEntry&&) = delete;

  LogEntry(const LogEntry&) = delete;
  LogEntry& operator=(const LogEntry&) = delete;

  template <typename T>
  LogEntry& operator<<(T const& v) {
    if (!muted) {
      std::cerr << v;
    }
    return *this;
  }

  LogEntry& operator<<(std::ostream& (*m)(std::ostream&)) {
    if (!muted) {
      m(std::cerr);
    }
    return *this;
  }

 private:
  Level lvl;
  bool muted;
  std::unique_lock<std::mutex> lock;

  static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
  }
};

struct Logger {
  Level lvl;
  constexpr Logger(Level L) : lvl(L) {
  }

  // first << on a Logger opens a LogEntry
  template <typename T>
  LogEntry operator<<(T const& v) const {
    LogEntry e(lvl);
    e << v;
    return e;
  }

  LogEntry operator<<(std::ostream& (*m)(std::ostream&)) const {
    LogEntry e(lvl);
    e << m;
    return e;
  }
};

inline constexpr Logger debug{Level::Debug};
inline constexpr Logger info{Level::Info};
inline constexpr Logger warning{Level::Warning};
inline constexpr Logger error{Level::Error};
}  // namespace logr

// Usage:
//   IF_DEBUG {
//     logr::debug << "expensive: " << expensive_function();
//   }
#define IF_DEBUG if (logr::CurrentLevel() <= logr::Level::Debug)
#define IF_INFO if (logr::CurrentLevel() <= logr::Level::Info)
#define IF_WARNING if (logr::CurrentLevel() <= logr::Level::Warning)
#define IF_ERROR if (logr::CurrentLevel() <= logr::Level::Error)
