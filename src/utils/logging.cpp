#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "constants.hpp"
#include "string_utils.hpp"

namespace logging {

    std::shared_ptr<spdlog::logger> attach_logger(const std::string& name) {
        std::shared_ptr<spdlog::logger> existing = spdlog::get(name);
        if (existing != nullptr) {
            return existing;
        }

        std::shared_ptr<spdlog::logger> created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::off);
        return created;
    }

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag init_flag;
        static std::shared_ptr<spdlog::logger> instance;

        std::call_once(init_flag, [] { instance = attach_logger(constants::LOGGER_NAME); });

        return instance;
    }

    void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

    spdlog::level::level_enum parse_level(const std::string& name) {
        const std::string lowered = string_utils::to_lower(string_utils::trim(name));

        if (lowered == "trace") {
            return spdlog::level::trace;
        }
        if (lowered == "debug") {
            return spdlog::level::debug;
        }
        if (lowered == "info") {
            return spdlog::level::info;
        }
        if (lowered == "warn" || lowered == "warning") {
            return spdlog::level::warn;
        }
        if (lowered == "error") {
            return spdlog::level::err;
        }
        if (lowered == "critical") {
            return spdlog::level::critical;
        }
        if (lowered == "off") {
            return spdlog::level::off;
        }

        throw std::runtime_error("Invalid log level: " + name);
    }

    void enable(const std::string& level_name) { set_level(parse_level(level_name)); }

    void disable() { set_level(spdlog::level::off); }
}  // namespace logging
