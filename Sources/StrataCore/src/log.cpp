#include "strata/log.hpp"
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace strata {

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

log_sink& current_sink() {
    static log_sink sink;
    return sink;
}

} // namespace

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

void set_log_sink(log_sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

namespace detail {

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list measure;
    va_copy(measure, args);
    int size = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);

    std::string message;
    if (size > 0) {
        std::vector<char> buffer(static_cast<size_t>(size) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        message.assign(buffer.data(), static_cast<size_t>(size));
    }
    va_end(args);

    log_sink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = current_sink();
    }
    if (sink) {
        sink(level, tag, message);
    } else {
        std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());
    }
}

} // namespace detail

} // namespace strata
