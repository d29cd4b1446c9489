/*
Rampart — Log
Role: Header-only leveled logger behind the LOG_* macros and the rLog_* category helpers.
Inputs/Outputs: fmt format strings in; one line per record, INFO and below on stdout, WARN and
                ERROR on stderr.
Threading: The level is an atomic; each record is a single fmt::print call.
Configuration: RAMPART_LOG (trace|debug|info|warn|error) fixes the level for the process;
               otherwise RampartRuntime applies runtime.log_level through setLevel().
Related: RampartLogging.hpp.
*/
#pragma once
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string_view>
#include <thread>

namespace Rampart {
namespace Log {

enum class Level { TRACE=0, DEBUG, INFO, WARN, ERROR };

inline Level parseLevel(const char* text) {
    if (!text) return Level::INFO;
    std::string_view s(text);
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info")  return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    return Level::ERROR;
}

inline std::atomic<Level>& runtimeLevel() {
    static std::atomic<Level> level{[]{
        if (const char* env = std::getenv("RAMPART_LOG")) return parseLevel(env);
#ifdef NDEBUG
        return Level::INFO;
#else
        return Level::DEBUG;
#endif
    }()};
    return level;
}

inline bool enabled(Level lvl) {
    return lvl >= runtimeLevel().load(std::memory_order_relaxed);
}

// RAMPART_LOG wins when set.
inline void setLevel(Level lvl) {
    if (std::getenv("RAMPART_LOG")) return;
    runtimeLevel().store(lvl, std::memory_order_relaxed);
}

inline const char* toString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        default:           return "ERROR";
    }
}

inline std::string_view baseName(const char* file) {
    std::string_view f(file);
    const auto pos = f.find_last_of("/\\");
    return pos == std::string_view::npos ? f : f.substr(pos + 1);
}

// Short stable tag per thread; std::thread::id has no fmt formatter.
inline unsigned threadTag() {
    thread_local const unsigned tag =
        static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
    return tag;
}

template<class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line,
                fmt::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(lvl)) return;
    const auto now = std::chrono::system_clock::now();
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    const auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    std::FILE* out = lvl >= Level::WARN ? stderr : stdout;
    fmt::print(out, "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][t{:05}][{}:{}] {}\n",
               std::chrono::floor<std::chrono::seconds>(now), us % 1000000,
               toString(lvl), category, threadTag(), baseName(file), line, msg);
}

} // namespace Log
} // namespace Rampart

#define LOG_IMPL(level, cat, fmt, ...) \
    do { if (::Rampart::Log::enabled(::Rampart::Log::Level::level)) \
        ::Rampart::Log::log(::Rampart::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__); } while (0)
#define LOG_T(cat, fmt, ...) LOG_IMPL(TRACE, cat, fmt, __VA_ARGS__)
#define LOG_D(cat, fmt, ...) LOG_IMPL(DEBUG, cat, fmt, __VA_ARGS__)
#define LOG_I(cat, fmt, ...) LOG_IMPL(INFO,  cat, fmt, __VA_ARGS__)
#define LOG_W(cat, fmt, ...) LOG_IMPL(WARN,  cat, fmt, __VA_ARGS__)
#define LOG_E(cat, fmt, ...) LOG_IMPL(ERROR, cat, fmt, __VA_ARGS__)

// Per call site; the counters are shared by every thread passing through it.
#define LOG_EVERY_N(level, N, cat, fmt, ...) \
    do { static std::atomic<int> LOG_##level##_CNT{0}; \
         if (++LOG_##level##_CNT % (N) == 0) LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } while (0)
#define LOG_FIRST_N(level, N, cat, fmt, ...) \
    do { static std::atomic<int> LOG_##level##_FIRST_CNT{0}; \
         if (LOG_##level##_FIRST_CNT.fetch_add(1) < (N)) LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } while (0)
