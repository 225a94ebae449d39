#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace conlog {

namespace ansi {
    inline constexpr std::string_view reset = "\x1b[0m";

    // color
    inline constexpr std::string_view red = "\x1b[31m";
    inline constexpr std::string_view green = "\x1b[32m";
    inline constexpr std::string_view yellow = "\x1b[33m";
    inline constexpr std::string_view blue = "\x1b[34m";
    inline constexpr std::string_view gray = "\x1b[90m";

    // style
    inline constexpr std::string_view bold = "\x1b[1m";
    inline constexpr std::string_view italic = "\x1b[3m";
}

enum class Level {
    Error = 0,
    Warning,
    Success,
    Info,
    Debug
};

inline constexpr size_t num_levels = 5;

inline constexpr std::array<Level, num_levels> all_levels = {
    Level::Error, Level::Warning, Level::Success, Level::Info, Level::Debug
};

constexpr size_t level_index(Level level) { return static_cast<size_t>(level); }

std::string_view level_name(Level level);
std::string_view level_color(Level level);

// case-insensitive, "WARN" is accepted for WARNING
std::optional<Level> parse_level(std::string_view name);

}
