#include "config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "../../http/provider/easypost.hpp"
#include "../../http/provider/veeqo.hpp"
#include "../../utils/logger.hpp"
#include "../../utils/string_utils.hpp"

namespace bridge::config {
    namespace {
        class Reader {
           public:
            explicit Reader(const EnvLookup& env) : env_(env) {}

            std::string text(const std::string& name, const std::string& fallback) const {
                auto v = env_(name);
                if (!v || string_utils::trim(*v).empty()) {
                    return fallback;
                }
                return string_utils::trim(*v);
            }

            long number(const std::string& name, long fallback) {
                auto v = env_(name);
                if (!v || string_utils::trim(*v).empty()) {
                    return fallback;
                }
                auto parsed = string_utils::parse_long(string_utils::trim(*v));
                if (!parsed) {
                    problems_.push_back(name + " must be an integer, got '" + *v + "'");
                    return fallback;
                }
                return *parsed;
            }

            std::vector<std::string>& problems() { return problems_; }

           private:
            const EnvLookup& env_;
            std::vector<std::string> problems_;
        };

        std::string join_problems(const std::vector<std::string>& problems) {
            std::string out = "Invalid configuration:";
            for (const auto& p : problems) {
                out += "\n  - " + p;
            }
            return out;
        }
    }  // namespace

    EnvLookup process_env() {
        return [](const std::string& name) -> std::optional<std::string> {
            const char* v = std::getenv(name.c_str());
            if (v == nullptr) {
                return std::nullopt;
            }
            return std::string(v);
        };
    }

    BridgeConfig load_config(const EnvLookup& env) {
        Reader r(env);
        BridgeConfig cfg;

        cfg.easypost_.api_key_ = r.text("EASYPOST_API_KEY", "");
        cfg.easypost_.base_url_ = r.text("EASYPOST_BASE_URL", http::provider::EasyPostProvider::DEFAULT_BASE_URL);
        cfg.easypost_.timeout_ = std::chrono::milliseconds{r.number("EASYPOST_TIMEOUT", constants::DEFAULT_TIMEOUT_MS)};

        cfg.veeqo_.api_key_ = r.text("VEEQO_API_KEY", "");
        cfg.veeqo_.base_url_ = r.text("VEEQO_BASE_URL", http::provider::VeeqoProvider::DEFAULT_BASE_URL);
        cfg.veeqo_.timeout_ = std::chrono::milliseconds{r.number("VEEQO_TIMEOUT", constants::DEFAULT_TIMEOUT_MS)};

        cfg.max_attempts_ = r.number("HTTP_MAX_ATTEMPTS", constants::MAX_ATTEMPTS);
        cfg.base_delay_ = std::chrono::milliseconds{r.number("HTTP_BASE_DELAY_MS", constants::BASE_DELAY_MS)};
        cfg.max_delay_ = std::chrono::milliseconds{r.number("HTTP_MAX_DELAY_MS", constants::MAX_DELAY_MS)};

        cfg.breaker_threshold_ = r.number("BREAKER_THRESHOLD", constants::BREAKER_FAILURE_THRESHOLD);
        cfg.breaker_reset_timeout_ = std::chrono::milliseconds{r.number("BREAKER_RESET_TIMEOUT_MS", constants::BREAKER_RESET_TIMEOUT_MS)};

        cfg.idempotency_window_ = std::chrono::seconds{r.number("IDEMPOTENCY_WINDOW_S", constants::ONE_DAY_S)};

        cfg.log_level_ = string_utils::to_lower(r.text("LOG_LEVEL", "info"));

        auto problems = std::move(r.problems());
        for (auto& p : config_problems(cfg)) {
            problems.push_back(std::move(p));
        }
        if (!problems.empty()) {
            throw std::runtime_error(join_problems(problems));
        }

        return cfg;
    }

    std::vector<std::string> config_problems(const BridgeConfig& cfg) {
        std::vector<std::string> problems;

        if (cfg.easypost_.api_key_.empty()) {
            problems.emplace_back("EASYPOST_API_KEY is required");
        }
        if (cfg.veeqo_.api_key_.empty()) {
            problems.emplace_back("VEEQO_API_KEY is required");
        }
        if (cfg.easypost_.base_url_.rfind("http", 0) != 0) {
            problems.emplace_back("EASYPOST_BASE_URL must be an http(s) URL");
        }
        if (cfg.veeqo_.base_url_.rfind("http", 0) != 0) {
            problems.emplace_back("VEEQO_BASE_URL must be an http(s) URL");
        }
        if (cfg.easypost_.timeout_.count() <= 0) {
            problems.emplace_back("EASYPOST_TIMEOUT must be positive");
        }
        if (cfg.veeqo_.timeout_.count() <= 0) {
            problems.emplace_back("VEEQO_TIMEOUT must be positive");
        }
        if (cfg.max_attempts_ <= 0) {
            problems.emplace_back("HTTP_MAX_ATTEMPTS must be positive");
        }
        if (cfg.base_delay_.count() <= 0) {
            problems.emplace_back("HTTP_BASE_DELAY_MS must be positive");
        }
        if (cfg.max_delay_ < cfg.base_delay_) {
            problems.emplace_back("HTTP_MAX_DELAY_MS must not be below HTTP_BASE_DELAY_MS");
        }
        if (cfg.breaker_threshold_ <= 0) {
            problems.emplace_back("BREAKER_THRESHOLD must be positive");
        }
        if (cfg.breaker_reset_timeout_.count() <= 0) {
            problems.emplace_back("BREAKER_RESET_TIMEOUT_MS must be positive");
        }
        if (cfg.idempotency_window_.count() <= 0) {
            problems.emplace_back("IDEMPOTENCY_WINDOW_S must be positive");
        }
        try {
            (void)logger::level_from_str(cfg.log_level_);
        } catch (const std::invalid_argument& e) {
            problems.emplace_back("LOG_LEVEL: " + std::string(e.what()));
        }

        return problems;
    }

    void validate_config(const BridgeConfig& cfg) {
        const auto problems = config_problems(cfg);
        if (!problems.empty()) {
            throw std::runtime_error(join_problems(problems));
        }
    }
}  // namespace bridge::config
