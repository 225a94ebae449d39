#include "include/config.hpp"
#include "include/level.hpp"
#include "include/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

// in-memory FILE* (open_memstream), contents readable at any point
class MemStream {
    public:
        MemStream(): buf_{nullptr}, len_{0} {
            f_ = open_memstream(&buf_, &len_);
            if (f_ == nullptr) {
                throw std::runtime_error("Failed to open memstream");
            }
        }
        MemStream(const MemStream& other) = delete;
        MemStream& operator=(const MemStream& other) = delete;
        std::FILE* file() const { return f_; }
        std::string contents() {
            std::fflush(f_);
            return std::string(buf_, len_);
        }
        ~MemStream() {
            std::fclose(f_);
            std::free(buf_);
        }
    private:
        std::FILE* f_;
        char* buf_;
        size_t len_;
};

struct Capture {
    MemStream out;
    MemStream err;
    conlog::Streams streams() const { return {.out_ = out.file(), .error_ = err.file()}; }
};

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            result.push_back(text.substr(start));
            break;
        }
        result.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return result;
}

static bool has_control_char(const std::string& text) {
    for (unsigned char c: text) {
        if (c < 0x20 && c != '\n') {
            return true;
        }
    }
    return false;
}

static conlog::EnvLookup env(std::map<std::string, std::string> vars) {
    return [vars](const char* name) -> std::optional<std::string_view> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return std::string_view(it->second);
    };
}

TEST(LEVEL, TEST_NAMES_AND_COLORS) {
    using conlog::Level;
    ASSERT_EQ(conlog::level_name(Level::Error), "ERROR");
    ASSERT_EQ(conlog::level_name(Level::Warning), "WARNING");
    ASSERT_EQ(conlog::level_name(Level::Success), "SUCCESS");
    ASSERT_EQ(conlog::level_name(Level::Info), "INFO");
    ASSERT_EQ(conlog::level_name(Level::Debug), "DEBUG");

    ASSERT_EQ(conlog::level_color(Level::Error), "\x1b[31m");
    ASSERT_EQ(conlog::level_color(Level::Warning), "\x1b[33m");
    ASSERT_EQ(conlog::level_color(Level::Success), "\x1b[32m");
    ASSERT_EQ(conlog::level_color(Level::Info), "\x1b[34m");
    ASSERT_EQ(conlog::level_color(Level::Debug), "\x1b[90m");
}

TEST(LEVEL, TEST_PARSE) {
    using conlog::Level;
    ASSERT_EQ(conlog::parse_level("ERROR"), Level::Error);
    ASSERT_EQ(conlog::parse_level("warning"), Level::Warning);
    ASSERT_EQ(conlog::parse_level("Warn"), Level::Warning);
    ASSERT_EQ(conlog::parse_level("success"), Level::Success);
    ASSERT_EQ(conlog::parse_level("debug"), Level::Debug);
    ASSERT_EQ(conlog::parse_level("trace"), std::nullopt);
    ASSERT_EQ(conlog::parse_level(""), std::nullopt);
}

TEST(CONFIG, TEST_ENABLED_TABLE) {
    for (bool debug_mode: {false, true}) {
        conlog::LoggerConfig config(debug_mode);
        ASSERT_TRUE(config.enabled(conlog::Level::Error));
        ASSERT_TRUE(config.enabled(conlog::Level::Warning));
        ASSERT_TRUE(config.enabled(conlog::Level::Success));
        ASSERT_TRUE(config.enabled(conlog::Level::Info));
        ASSERT_EQ(config.enabled(conlog::Level::Debug), debug_mode);
        ASSERT_EQ(config.color(), debug_mode);
        ASSERT_EQ(config.debug_mode(), debug_mode);
    }
}

TEST(CONFIG, TEST_COLOR_INDEPENDENT_OF_DEBUG) {
    conlog::LoggerConfig color_only(false, true);
    ASSERT_FALSE(color_only.enabled(conlog::Level::Debug));
    ASSERT_TRUE(color_only.color());

    conlog::LoggerConfig debug_only(true, false);
    ASSERT_TRUE(debug_only.enabled(conlog::Level::Debug));
    ASSERT_FALSE(debug_only.color());
}

TEST(CONFIG, TEST_PARSE_FLAG) {
    ASSERT_EQ(conlog::parse_flag("true"), true);
    ASSERT_EQ(conlog::parse_flag("TRUE"), true);
    ASSERT_EQ(conlog::parse_flag("1"), true);
    ASSERT_EQ(conlog::parse_flag("on"), true);
    ASSERT_EQ(conlog::parse_flag("false"), false);
    ASSERT_EQ(conlog::parse_flag("0"), false);
    ASSERT_EQ(conlog::parse_flag(""), false);
    ASSERT_EQ(conlog::parse_flag("maybe"), std::nullopt);
}

TEST(CONFIG, TEST_FROM_ENVIRONMENT) {
    using conlog::LoggerConfig;
    ASSERT_FALSE(LoggerConfig::from_environment(env({})).debug_mode());
    ASSERT_TRUE(LoggerConfig::from_environment(env({{"DEBUG", "true"}})).debug_mode());
    ASSERT_FALSE(LoggerConfig::from_environment(env({{"DEBUG", "false"}})).debug_mode());
    ASSERT_FALSE(LoggerConfig::from_environment(env({{"DEBUG", "garbage"}})).debug_mode());
    ASSERT_TRUE(LoggerConfig::from_environment(env({{"APP_ENV", "development"}})).debug_mode());
    ASSERT_FALSE(LoggerConfig::from_environment(env({{"APP_ENV", "production"}})).debug_mode());
    ASSERT_TRUE(LoggerConfig::from_environment(env({{"DEBUG", "false"}, {"APP_ENV", "development"}})).debug_mode());

    auto config = LoggerConfig::from_environment(env({{"DEBUG", "true"}}));
    ASSERT_TRUE(config.color());
    ASSERT_TRUE(config.enabled(conlog::Level::Debug));
}

TEST(CONFIG, TEST_FROM_PROCESS_ENVIRONMENT) {
    unsetenv("APP_ENV");
    setenv("DEBUG", "true", 1);
    ASSERT_TRUE(conlog::LoggerConfig::from_environment().debug_mode());
    unsetenv("DEBUG");
    ASSERT_FALSE(conlog::LoggerConfig::from_environment().debug_mode());
}

TEST(PREFIX, TEST_PLAIN) {
    ASSERT_EQ(conlog::styled_prefix(conlog::Level::Error, false), "[ERROR]");
    ASSERT_EQ(conlog::styled_prefix(conlog::Level::Debug, false), "[DEBUG]");
}

TEST(PREFIX, TEST_COLORED) {
    ASSERT_EQ(conlog::styled_prefix(conlog::Level::Success, true),
              "\x1b[1m\x1b[32m[\x1b[3mSUCCESS\x1b[0m\x1b[1m\x1b[32m]\x1b[0m");
}

TEST(PREFIX, TEST_FORMAT_LINE) {
    ASSERT_EQ(conlog::format_line(conlog::Level::Info, false, "hello"), "[INFO] hello");
    ASSERT_EQ(conlog::format_line(conlog::Level::Warning, false, "ratio:", 0.5, true), "[WARNING] ratio: 0.5 true");
}

TEST(LOGGER, TEST_ERROR_TO_ERROR_STREAM) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(false), capture.streams());
    logger.log(conlog::Level::Error, "x not found:", "config.json");
    ASSERT_EQ(capture.err.contents(), "[ERROR] x not found: config.json\n");
    ASSERT_EQ(capture.out.contents(), "");
}

TEST(LOGGER, TEST_SUCCESS_TO_OUT_STREAM) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(false), capture.streams());
    logger.log(conlog::Level::Success, "done. count:", 42, "items");
    ASSERT_EQ(capture.out.contents(), "[SUCCESS] done. count: 42 items\n");
    ASSERT_EQ(capture.err.contents(), "");
}

TEST(LOGGER, TEST_DEBUG_DISABLED_IS_SILENT) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(false), capture.streams());
    logger.log(conlog::Level::Debug, "value:", "{a:1}");
    logger.debug("value:", 1);
    ASSERT_EQ(capture.out.contents(), "");
    ASSERT_EQ(capture.err.contents(), "");
}

TEST(LOGGER, TEST_ALWAYS_ENABLED_LEVELS) {
    for (bool debug_mode: {false, true}) {
        Capture capture;
        conlog::Logger logger(conlog::LoggerConfig(debug_mode), capture.streams());
        logger.error("e");
        logger.warn("w");
        logger.success("s");
        logger.info("i");

        ASSERT_EQ(lines(capture.err.contents()).size(), 1);
        ASSERT_EQ(lines(capture.out.contents()).size(), 3);
    }
}

TEST(LOGGER, TEST_DEBUG_ENABLED) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(true), capture.streams());
    logger.debug("value:", 7);
    auto out = lines(capture.out.contents());
    ASSERT_EQ(out.size(), 1);
    ASSERT_NE(out[0].find("DEBUG"), std::string::npos);
    ASSERT_NE(out[0].find("value: 7"), std::string::npos);
    ASSERT_EQ(capture.err.contents(), "");
}

TEST(LOGGER, TEST_NO_CONTROL_CHARS_WITHOUT_DEBUG) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(false), capture.streams());
    for (auto level: conlog::all_levels) {
        logger.log(level, "message", 1, "two");
    }
    ASSERT_FALSE(has_control_char(capture.out.contents()));
    ASSERT_FALSE(has_control_char(capture.err.contents()));
    ASSERT_EQ(lines(capture.out.contents()).size(), 3);
}

TEST(LOGGER, TEST_COLOR_CODES_WITH_DEBUG) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(true), capture.streams());
    for (auto level: conlog::all_levels) {
        logger.log(level, "message");
    }
    auto err = lines(capture.err.contents());
    auto out = lines(capture.out.contents());
    ASSERT_EQ(err.size(), 1);
    ASSERT_EQ(out.size(), 4);
    ASSERT_NE(err[0].find(conlog::level_color(conlog::Level::Error)), std::string::npos);
    ASSERT_NE(out[0].find(conlog::level_color(conlog::Level::Warning)), std::string::npos);
    ASSERT_NE(out[1].find(conlog::level_color(conlog::Level::Success)), std::string::npos);
    ASSERT_NE(out[2].find(conlog::level_color(conlog::Level::Info)), std::string::npos);
    ASSERT_NE(out[3].find(conlog::level_color(conlog::Level::Debug)), std::string::npos);
}

TEST(LOGGER, TEST_LEVEL_LOGGER) {
    Capture capture;
    conlog::Logger logger(conlog::LoggerConfig(false), capture.streams());
    auto warn = logger.at(conlog::Level::Warning);
    ASSERT_EQ(warn.level(), conlog::Level::Warning);
    warn("disk usage:", 91, "%");
    ASSERT_EQ(capture.out.contents(), "[WARNING] disk usage: 91 %\n");
}

TEST(LOGGER, TEST_LEVEL_LOGGER_OUTLIVES_LOGGER) {
    Capture capture;
    auto info = conlog::Logger(conlog::LoggerConfig(false), capture.streams()).at(conlog::Level::Info);
    info("loaded", 3, "entries");
    ASSERT_EQ(capture.out.contents(), "[INFO] loaded 3 entries\n");
}

TEST(LOGGER, TEST_ASSIGNABLE) {
    static_assert(std::is_copy_assignable_v<conlog::Logger>);
    Capture first;
    Capture second;
    conlog::Logger logger(conlog::LoggerConfig(false), first.streams());
    logger = conlog::Logger(conlog::LoggerConfig(true), second.streams());
    logger.debug("after reassign");
    ASSERT_TRUE(logger.config().debug_mode());
    ASSERT_EQ(first.out.contents(), "");
    ASSERT_NE(second.out.contents().find("after reassign"), std::string::npos);
}

TEST(LOGGER, TEST_WRITE_FAILURE_PROPAGATES) {
    std::FILE* read_only = std::fopen("/dev/null", "r");
    ASSERT_NE(read_only, nullptr);
    conlog::Logger logger(conlog::LoggerConfig(false), conlog::Streams{.out_ = read_only, .error_ = read_only});
    EXPECT_THROW(logger.info("x"), std::system_error);
    EXPECT_THROW(logger.error("x"), std::system_error);
    std::fclose(read_only);
}

TEST(LOGGER, TEST_NULL_STREAM_THROWS) {
    ASSERT_THROW(conlog::Logger(conlog::LoggerConfig(false), conlog::Streams{.out_ = nullptr, .error_ = stderr}),
                 std::invalid_argument);
}

TEST(LOGGER, TEST_DEFAULT_STREAMS) {
    conlog::Logger logger(conlog::LoggerConfig(false));
    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger.info("to stdout");
    logger.error("to stderr");
    auto out = ::testing::internal::GetCapturedStdout();
    auto err = ::testing::internal::GetCapturedStderr();
    ASSERT_EQ(out, "[INFO] to stdout\n");
    ASSERT_EQ(err, "[ERROR] to stderr\n");
}
