#include "logger.hpp"

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "string_utils.hpp"

namespace logger {
    namespace {
        spdlog::level::level_enum to_spdlog(Level lvl) {
            switch (lvl) {
                case Level::DEBUG:
                    return spdlog::level::debug;
                case Level::INFO:
                    return spdlog::level::info;
                case Level::WARN:
                    return spdlog::level::warn;
                case Level::ERROR:
                    return spdlog::level::err;
            }
            return spdlog::level::info;
        }
    }  // namespace

    Level level_from_str(const std::string& str) {
        const std::string lvl = string_utils::to_lower(string_utils::trim(str));
        if (lvl == "debug" || lvl == "trace") {
            return Level::DEBUG;
        }
        if (lvl == "info") {
            return Level::INFO;
        }
        if (lvl == "warn" || lvl == "warning") {
            return Level::WARN;
        }
        if (lvl == "error" || lvl == "err") {
            return Level::ERROR;
        }
        throw std::invalid_argument("Unknown log level: " + str);
    }

    void create_console_logger(Level lvl) {
        auto l = std::make_shared<spdlog::logger>(LOGGER_NAME, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        l->set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] %v");
        l->set_level(to_spdlog(lvl));
        install(std::move(l));
    }

    void install(std::shared_ptr<spdlog::logger> l) {
        if (l == nullptr) {
            throw std::invalid_argument("logger must not be null");
        }
        spdlog::drop(LOGGER_NAME);
        spdlog::register_logger(l->name() == LOGGER_NAME ? std::move(l) : l->clone(LOGGER_NAME));
    }

    std::shared_ptr<spdlog::logger> get() {
        auto l = spdlog::get(LOGGER_NAME);
        if (l == nullptr) {
            return spdlog::default_logger();
        }
        return l;
    }

    std::string format_fields(const Fields& fields) {
        std::string out;
        for (const auto& [key, value] : fields) {
            if (!out.empty()) {
                out.push_back(' ');
            }
            if (value.find(' ') != std::string::npos) {
                out += fmt::format("{}=\"{}\"", key, value);
            } else {
                out += fmt::format("{}={}", key, value);
            }
        }
        return out;
    }

    void log(Level lvl, std::string_view msg, const Fields& fields) {
        auto l = get();
        const auto spd_lvl = to_spdlog(lvl);
        if (!l->should_log(spd_lvl)) {
            return;
        }
        if (fields.empty()) {
            l->log(spd_lvl, "{}", msg);
        } else {
            l->log(spd_lvl, "{} {}", msg, format_fields(fields));
        }
    }
}  // namespace logger
