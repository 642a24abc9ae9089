/**
 * @file Log.hpp
 * @brief Leveled diagnostic logging
 *
 * Messages are fmt format strings tagged with the source file and line,
 * written to stderr. The level is process-wide and defaults to WARNING so
 * library users see nothing unless something goes wrong; the CLI raises it
 * to DEBUG with --verbose.
 *
 * Usage:
 * ```cpp
 * DATAMERGE_DEBUG("merged {} sources with {} conflicts", n, conflicts.size());
 * ```
 */

#ifndef DATAMERGE_LOG_HPP
#define DATAMERGE_LOG_HPP

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <utility>

namespace datamerge {
namespace log {

enum Level
{
    FATAL,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
};

inline std::atomic<int>& current_level() {
    static std::atomic<int> level{WARNING};
    return level;
}

inline void set_level(Level level) {
    current_level().store(level);
}

inline Level get_level() {
    return static_cast<Level>(current_level().load());
}

inline bool enabled(Level level) {
    return current_level().load() >= level;
}

inline
std::string_view trim_file_name(const char* file) {
    auto len = std::strlen(file);
    return (len > 20)? std::string_view{(file + len - 20), 20}: std::string_view{file, len};
}

template <typename ... Args>
void log(const char* file, int line, const char* level_name, const char* format, Args&& ... args) {
    fmt::print(stderr, "{}{}:{} {}\n", level_name, trim_file_name(file), line,
               fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

} // namespace log
} // namespace datamerge

#define DATAMERGE_DEBUG(...) { if (::datamerge::log::enabled(::datamerge::log::DEBUG))   ::datamerge::log::log(__FILE__, __LINE__, "[DEBUG] ",   __VA_ARGS__); }
#define DATAMERGE_INFO(...)  { if (::datamerge::log::enabled(::datamerge::log::INFO))    ::datamerge::log::log(__FILE__, __LINE__, "[INFO] ",    __VA_ARGS__); }
#define DATAMERGE_WARN(...)  { if (::datamerge::log::enabled(::datamerge::log::WARNING)) ::datamerge::log::log(__FILE__, __LINE__, "[WARNING] ", __VA_ARGS__); }
#define DATAMERGE_ERROR(...) { if (::datamerge::log::enabled(::datamerge::log::ERROR))   ::datamerge::log::log(__FILE__, __LINE__, "[ERROR] ",   __VA_ARGS__); }

#endif // DATAMERGE_LOG_HPP
