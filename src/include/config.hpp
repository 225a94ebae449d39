#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string_view>
#include "level.hpp"

namespace conlog {

// returns nullopt when the variable is unset
using EnvLookup = std::function<std::optional<std::string_view>(const char*)>;

std::optional<std::string_view> process_env(const char* name);

// true/1/yes/on, false/0/no/off/"" (case-insensitive), nullopt otherwise
std::optional<bool> parse_flag(std::string_view value);

inline constexpr const char* debug_env_var = "DEBUG";
inline constexpr const char* mode_env_var = "APP_ENV";
inline constexpr std::string_view development_mode = "development";

// Built once at startup and never mutated afterwards.
// ERROR, WARNING, SUCCESS and INFO are always enabled, DEBUG follows debug_mode.
class LoggerConfig {
    public:
        LoggerConfig() = delete;
        explicit LoggerConfig(bool debug_mode): LoggerConfig(debug_mode, debug_mode) {};
        LoggerConfig(bool debug_mode, bool color);

        // DEBUG=<true-like> or APP_ENV=development turns on debug mode
        static LoggerConfig from_environment(const EnvLookup& lookup = process_env);

        bool enabled(Level level) const { return enabled_.at(level_index(level)); };
        bool color() const { return color_; };
        bool debug_mode() const { return debug_mode_; };
    private:
        bool debug_mode_;
        bool color_;
        std::array<bool, num_levels> enabled_;
};

}
