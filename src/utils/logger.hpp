#ifndef PARCEL_BRIDGE_LOGGER_HPP
#define PARCEL_BRIDGE_LOGGER_HPP

#include <spdlog/fwd.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logger {
    inline constexpr const char* LOGGER_NAME = "parcel_bridge";

    enum class Level { DEBUG, INFO, WARN, ERROR };

    // Structured fields, rendered as key=value after the message.
    using Fields = std::vector<std::pair<std::string, std::string>>;

    Level level_from_str(const std::string& str);

    void create_console_logger(Level lvl);

    // Replaces the registered logger, e.g. with one writing to a ring buffer sink.
    void install(std::shared_ptr<spdlog::logger> l);

    std::shared_ptr<spdlog::logger> get();

    std::string format_fields(const Fields& fields);

    void log(Level lvl, std::string_view msg, const Fields& fields = {});

    inline void debug(std::string_view msg, const Fields& fields = {}) { log(Level::DEBUG, msg, fields); }
    inline void info(std::string_view msg, const Fields& fields = {}) { log(Level::INFO, msg, fields); }
    inline void warn(std::string_view msg, const Fields& fields = {}) { log(Level::WARN, msg, fields); }
    inline void error(std::string_view msg, const Fields& fields = {}) { log(Level::ERROR, msg, fields); }
}  // namespace logger

#endif
