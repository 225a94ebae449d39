#include "include/logging.hpp"
#include <format>
#include <print>
#include <stdexcept>

namespace conlog {

std::string styled_prefix(Level level, bool color) {
    auto name = level_name(level);
    if (!color) {
        return std::format("[{}]", name);
    }
    auto c = level_color(level);
    return std::format("{0}{1}[{2}{3}{4}{0}{1}]{4}", ansi::bold, c, ansi::italic, name, ansi::reset);
}

Logger::Logger(LoggerConfig config, Streams streams)
    : config_{config}, streams_{streams} {
    if (streams_.out_ == nullptr || streams_.error_ == nullptr) {
        throw std::invalid_argument("Logger streams must not be null");
    }
}

void Logger::write(Level level, const std::string& line) const {
    auto stream = (level == Level::Error) ? streams_.error_ : streams_.out_;
    // single call so concurrent lines do not interleave; write errors propagate as std::system_error
    std::println(stream, "{}", line);
}

}
