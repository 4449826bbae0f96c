#pragma once
// Log.hpp – Tagged, levelled console logging for the codec and tools.
//
// Usage:
//   CAT62_LOG_WARNING("Codec::decodeRecord", "Unknown FRN %u at offset %zu", frn, pos);
//
// The level and sink are process-wide and meant to be configured once at
// start-up, before any codec call.  The default sink writes to stderr.

#include <functional>
#include <string>

namespace cat62::log {

enum class Level { Debug = 0, Info, Warning, Error, Off };

using Sink = std::function<void(Level, const char* tag, const std::string& message)>;

void  setLevel(Level level) noexcept;
Level level() noexcept;

// Replace the sink; an empty function restores the stderr sink.
void setSink(Sink sink);

[[nodiscard]] const char* levelName(Level level) noexcept;

[[nodiscard]] inline bool enabled(Level l) noexcept {
    return static_cast<int>(l) >= static_cast<int>(level());
}

// printf-style formatting; prefer the macros, which skip argument
// evaluation when the level is disabled.
void write(Level level, const char* tag, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace cat62::log

#define CAT62_LOG_AT(lvl, tag, format, ...)                                 \
    do {                                                                    \
        if (::cat62::log::enabled(lvl))                                     \
            ::cat62::log::write(lvl, tag, format __VA_OPT__(, ) __VA_ARGS__); \
    } while (0)

#define CAT62_LOG_DEBUG(tag, format, ...)   CAT62_LOG_AT(::cat62::log::Level::Debug, tag, format __VA_OPT__(, ) __VA_ARGS__)
#define CAT62_LOG_INFO(tag, format, ...)    CAT62_LOG_AT(::cat62::log::Level::Info, tag, format __VA_OPT__(, ) __VA_ARGS__)
#define CAT62_LOG_WARNING(tag, format, ...) CAT62_LOG_AT(::cat62::log::Level::Warning, tag, format __VA_OPT__(, ) __VA_ARGS__)
#define CAT62_LOG_ERROR(tag, format, ...)   CAT62_LOG_AT(::cat62::log::Level::Error, tag, format __VA_OPT__(, ) __VA_ARGS__)
