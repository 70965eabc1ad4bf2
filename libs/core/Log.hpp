#pragma once
/*
rtmlink - Log
Role: Header-only levelled logging shared by the library, the CLI and the tests.
Output: one line per call on stderr,
        [YYYY-MM-DD HH:MM:SS.uuuuuu][LEVEL][category][thread][file:line] message
Configuration: RTMLINK_LOG=trace|debug|info|warn|error|off, read once; setLevel() overrides it.
Threading: Safe from any thread. The receive thread and callers of connect/disconnect log concurrently.
*/
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string_view>
#include <thread>

namespace rtmlink {
namespace Log {

enum class Level { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

// nullopt for anything unrecognized
inline std::optional<Level> parseLevel(std::string_view s) {
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info")  return Level::INFO;
    if (s == "warn")  return Level::WARN;
    if (s == "error") return Level::ERROR;
    if (s == "off")   return Level::OFF;
    return std::nullopt;
}

inline std::atomic<Level>& runtimeLevel() {
    static std::atomic<Level> level{[]{
#ifdef NDEBUG
        Level def = Level::INFO;
#else
        Level def = Level::DEBUG;
#endif
        if (const char* env = std::getenv("RTMLINK_LOG")) {
            if (auto parsed = parseLevel(env)) return *parsed;
        }
        return def;
    }()};
    return level;
}

inline void setLevel(Level lvl) { runtimeLevel().store(lvl, std::memory_order_relaxed); }

inline bool enabled(Level lvl) { return lvl >= runtimeLevel().load(std::memory_order_relaxed); }

inline const char* toString(Level lvl) {
    switch(lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        default:           return "OFF";
    }
}

inline std::string_view fileName(const char* path) {
    std::string_view f(path);
    const auto slash = f.find_last_of("/\\");
    return slash == std::string_view::npos ? f : f.substr(slash + 1);
}

// Short stable tag for the calling thread
inline std::size_t threadTag() {
    return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
}

template<class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line,
                fmt::format_string<Args...> pattern, Args&&... args) {
    if (!enabled(lvl)) return;
    const auto now = std::chrono::system_clock::now();
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    const auto msg = fmt::format(pattern, std::forward<Args>(args)...);
    // single write per line
    fmt::print(stderr, "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{:05}][{}:{}] {}\n",
               std::chrono::floor<std::chrono::seconds>(now), micros,
               toString(lvl), category, threadTag(), fileName(file), line, msg);
}

} // namespace Log
} // namespace rtmlink

#define RTMLINK_LOG_IMPL(level, cat, fmt, ...) ::rtmlink::Log::log(::rtmlink::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
#define RTMLINK_LOG_T(cat, fmt, ...) RTMLINK_LOG_IMPL(TRACE, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define RTMLINK_LOG_D(cat, fmt, ...) RTMLINK_LOG_IMPL(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define RTMLINK_LOG_I(cat, fmt, ...) RTMLINK_LOG_IMPL(INFO,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define RTMLINK_LOG_W(cat, fmt, ...) RTMLINK_LOG_IMPL(WARN,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define RTMLINK_LOG_E(cat, fmt, ...) RTMLINK_LOG_IMPL(ERROR, cat, fmt __VA_OPT__(, ) __VA_ARGS__)

// Logs every Nth call site hit; the counter is shared by all threads
#define RTMLINK_LOG_EVERY_N(level, N, cat, fmt, ...) \
    do { static std::atomic<long> rtmlink_every_n_{0}; if (++rtmlink_every_n_ % (N) == 0) RTMLINK_LOG_IMPL(level, cat, fmt __VA_OPT__(, ) __VA_ARGS__); } while (0)
