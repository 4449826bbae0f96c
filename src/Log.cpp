// Log.cpp – Process-wide log level and sink.

#include "Cat62Codec/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>

namespace cat62::log {

namespace {

std::atomic<Level> g_level{Level::Warning};
std::mutex         g_sink_mutex;
Sink               g_sink;

void stderrSink(Level level, const char* tag, const std::string& message) {
    std::fprintf(stderr, "%-7s | %s | %s\n", levelName(level), tag, message.c_str());
}

} // namespace

void setLevel(Level l) noexcept { g_level.store(l, std::memory_order_relaxed); }

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

const char* levelName(Level l) noexcept {
    switch (l) {
    case Level::Debug:   return "DEBUG";
    case Level::Info:    return "INFO";
    case Level::Warning: return "WARNING";
    case Level::Error:   return "ERROR";
    case Level::Off:     return "OFF";
    }
    return "?";
}

void write(Level l, const char* tag, const char* format, ...) {
    if (!enabled(l) || l == Level::Off) return;

    va_list args;
    va_start(args, format);
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(nullptr, 0, format, copy);
    va_end(copy);

    std::string message;
    if (needed > 0) {
        std::vector<char> buf(static_cast<size_t>(needed) + 1);
        std::vsnprintf(buf.data(), buf.size(), format, args);
        message.assign(buf.data(), static_cast<size_t>(needed));
    }
    va_end(args);

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) g_sink(l, tag, message);
    else        stderrSink(l, tag, message);
}

} // namespace cat62::log
