#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Parse "debug", "info", "warn", "error" or "fatal" (case-insensitive)
Level parse_level(const std::string& name);

// Initialize the log system. Console output goes to stderr, stdout is
// reserved for generated records.
void init(Level level = Level::Info,
          const std::string& log_file = "log/syngen.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

extern std::shared_ptr<spdlog::logger> logger;

// Writes to stderr with a plain tag until init() has run
template <typename... Args>
inline void log(spdlog::level::level_enum level, const char* tag,
                fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(level, fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << tag << ' ' << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, "[DEBUG]", fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, "[INFO]", fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, "[ERROR]", fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(spdlog::level::critical, "[FATAL]", fmt, std::forward<Args>(args)...);
}

}
