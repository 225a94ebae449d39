#include "include/level.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace conlog {

namespace {
    struct LevelStyle {
        std::string_view name_;
        std::string_view color_;
    };

    // indexed by Level
    constexpr std::array<LevelStyle, num_levels> styles = {{
        {"ERROR", ansi::red},
        {"WARNING", ansi::yellow},
        {"SUCCESS", ansi::green},
        {"INFO", ansi::blue},
        {"DEBUG", ansi::gray},
    }};

    std::string to_upper(std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::toupper(c); });
        return result;
    }
}

std::string_view level_name(Level level) {
    return styles.at(level_index(level)).name_;
}

std::string_view level_color(Level level) {
    return styles.at(level_index(level)).color_;
}

std::optional<Level> parse_level(std::string_view name) {
    auto upper = to_upper(name);
    if (upper == "WARN") {
        return Level::Warning;
    }
    for (auto level: all_levels) {
        if (level_name(level) == upper) {
            return level;
        }
    }
    return std::nullopt;
}

}
