#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include "config.hpp"
#include "level.hpp"

namespace conlog {

// [NAME] without color, otherwise the bracketed tag in bold + level color with an italic NAME
std::string styled_prefix(Level level, bool color);

// "<prefix> <message>" followed by each extra argument, space separated
template <typename... Args>
std::string format_line(Level level, bool color, std::string_view message, const Args&... args) {
    std::string line = styled_prefix(level, color);
    line += ' ';
    line += message;
    ((line += ' ', line += std::format("{}", args)), ...);
    return line;
}

struct Streams {
    std::FILE* out_ = stdout;
    std::FILE* error_ = stderr;
};

class LevelLogger;

class Logger {
    public:
        Logger() = delete;
        explicit Logger(LoggerConfig config, Streams streams = {});

        // no-op when the level is disabled; ERROR goes to the error stream, the rest to out
        template <typename... Args>
        void log(Level level, std::string_view message, const Args&... args) const {
            if (!config_.enabled(level)) {
                return;
            }
            write(level, format_line(level, config_.color(), message, args...));
        }

        template <typename... Args>
        void error(std::string_view message, const Args&... args) const { log(Level::Error, message, args...); };
        template <typename... Args>
        void warn(std::string_view message, const Args&... args) const { log(Level::Warning, message, args...); };
        template <typename... Args>
        void success(std::string_view message, const Args&... args) const { log(Level::Success, message, args...); };
        template <typename... Args>
        void info(std::string_view message, const Args&... args) const { log(Level::Info, message, args...); };
        template <typename... Args>
        void debug(std::string_view message, const Args&... args) const { log(Level::Debug, message, args...); };

        LevelLogger at(Level level) const;
        const LoggerConfig& config() const { return config_; };
    private:
        void write(Level level, const std::string& line) const;

        LoggerConfig config_;
        Streams streams_;
};

// a copy of a Logger with the level fixed, safe to keep after the Logger is gone
class LevelLogger {
    public:
        LevelLogger(Logger logger, Level level): logger_{logger}, level_{level} {};

        template <typename... Args>
        void operator()(std::string_view message, const Args&... args) const {
            logger_.log(level_, message, args...);
        }

        Level level() const { return level_; };
    private:
        Logger logger_;
        Level level_;
};

inline LevelLogger Logger::at(Level level) const {
    return LevelLogger(*this, level);
}

}
