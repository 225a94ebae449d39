#include "include/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace conlog {

std::optional<std::string_view> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string_view(value);
}

std::optional<bool> parse_flag(std::string_view value) {
    std::string lower(value);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower.empty() || lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

LoggerConfig::LoggerConfig(bool debug_mode, bool color)
    : debug_mode_{debug_mode}, color_{color}, enabled_{} {
    for (auto level: all_levels) {
        enabled_[level_index(level)] = (level == Level::Debug) ? debug_mode : true;
    }
}

LoggerConfig LoggerConfig::from_environment(const EnvLookup& lookup) {
    // unrecognised DEBUG values count as off
    bool debug_mode = lookup(debug_env_var)
        .and_then(parse_flag)
        .value_or(false);

    if (!debug_mode) {
        debug_mode = lookup(mode_env_var)
            .transform([](std::string_view mode) { return mode == development_mode; })
            .value_or(false);
    }
    return LoggerConfig(debug_mode);
}

}
