#include <format>
#include <print>
#include <string>
#include <config.hpp>
#include <logging.hpp>

struct User {
    std::string name_;
    int id_;
};

template <>
struct std::formatter<User> : std::formatter<std::string> {
    auto format(const User& user, std::format_context& ctx) const {
        return std::formatter<std::string>::format(std::format("{{ user: '{}', id: {} }}", user.name_, user.id_), ctx);
    }
};

int main() {
    // resolved once, DEBUG=true or APP_ENV=development enables DEBUG lines and color
    const auto config = conlog::LoggerConfig::from_environment();
    conlog::Logger logger(config);

    std::println("=== Level prefixes ===");
    logger.error("this is an error message");
    logger.success("this is a success message");
    logger.info("this is an info message");
    logger.debug("this is a debug message");
    logger.warn("this is a warning message");

    std::println("\n=== Multiple arguments ===");
    logger.error("x not found:", "config.json");
    logger.success("done. count:", 42, "items");
    logger.debug("value:", User{"test", 123});

    auto info = logger.at(conlog::Level::Info);
    info("debug mode:", config.debug_mode(), "color:", config.color());

    return 0;
}
