#pragma once

#ifdef __cplusplus

#include <atomic>
#include <functional>
#include <string>

namespace strata {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in StrataCore/src/strata.cpp. Defaults to off.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

const char* log_level_name(log_level level);

/// Receives each formatted message. The default sink writes "[tag] message"
/// to stderr.
using log_sink = std::function<void(log_level level, const char* tag, const std::string& message)>;

/// Replaces the sink. An empty sink restores stderr output.
void set_log_sink(log_sink sink);

namespace detail {
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    void log_write(log_level level, const char* tag, const char* fmt, ...);
} // namespace detail

}  // namespace strata

#define STRATA_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(strata::g_log_level.load(std::memory_order_relaxed))) { \
            strata::detail::log_write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) STRATA_LOG(strata::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  STRATA_LOG(strata::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  STRATA_LOG(strata::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) STRATA_LOG(strata::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
