#include "config.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace clump::config {
    namespace {
        long require_long(const char* key, const char* raw) {
            auto parsed = string_utils::parse_long(raw);
            if (!parsed) {
                throw std::runtime_error(std::string("Invalid ") + key + ": " + raw);
            }
            return *parsed;
        }

        long require_positive(const char* key, const char* raw) {
            const long value = require_long(key, raw);
            if (value <= 0) {
                throw std::runtime_error(std::string("Invalid ") + key + ": must be positive");
            }
            return value;
        }
    }  // namespace

    Config load(const EnvLookup& lookup) {
        Config config;

        if (const char* level = lookup(EnvKeys::LOG_LEVEL)) {
            logging::parse_level(level);  // validate early
            config.log_level_ = level;
        }

        if (const char* scheduler = lookup(EnvKeys::SCHEDULER)) {
            const std::string kind = string_utils::to_lower(string_utils::trim(scheduler));
            if (kind == "thread") {
                config.scheduler_.kind_ = concurrency::SchedulerKind::THREAD_PER_TASK;
            } else if (kind == "pool") {
                config.scheduler_.kind_ = concurrency::SchedulerKind::THREAD_POOL;
            } else {
                throw std::runtime_error(std::string("Invalid ") + EnvKeys::SCHEDULER + ": " + scheduler);
            }
        }

        if (const char* threads = lookup(EnvKeys::POOL_THREADS)) {
            config.scheduler_.pool_threads_ = static_cast<unsigned int>(require_positive(EnvKeys::POOL_THREADS, threads));
        }

        if (const char* status = lookup(EnvKeys::FAILURE_STATUS)) {
            const long value = require_long(EnvKeys::FAILURE_STATUS, status);
            if (value != constants::DEFAULT_FAILURE_STATUS && (value < constants::MIN_HTTP_STATUS || value > constants::MAX_HTTP_STATUS)) {
                throw std::runtime_error(std::string("Invalid ") + EnvKeys::FAILURE_STATUS + ": " + status);
            }
            config.dispatcher_.failure_status_ = value;
        }

        if (const char* deadline = lookup(EnvKeys::DEADLINE_MS)) {
            config.dispatcher_.deadline_ = std::chrono::milliseconds{require_positive(EnvKeys::DEADLINE_MS, deadline)};
        }

        if (const char* aggregate = lookup(EnvKeys::AGGREGATE)) {
            const std::string mode = string_utils::to_lower(string_utils::trim(aggregate));
            if (mode == "aligned") {
                config.dispatcher_.aggregate_mode_ = AggregateMode::ALIGNED;
            } else if (mode == "segregated") {
                config.dispatcher_.aggregate_mode_ = AggregateMode::SEGREGATED;
            } else {
                throw std::runtime_error(std::string("Invalid ") + EnvKeys::AGGREGATE + ": " + aggregate);
            }
        }

        if (const char* connect_timeout = lookup(EnvKeys::CONNECT_TIMEOUT_MS)) {
            config.transport_.connect_timeout_ = std::chrono::milliseconds{require_positive(EnvKeys::CONNECT_TIMEOUT_MS, connect_timeout)};
        }

        if (const char* timeout = lookup(EnvKeys::TIMEOUT_MS)) {
            config.transport_.timeout_ = std::chrono::milliseconds{require_positive(EnvKeys::TIMEOUT_MS, timeout)};
        }

        if (const char* connections = lookup(EnvKeys::MAX_CONNECTIONS)) {
            config.transport_.max_connections_ = static_cast<size_t>(require_positive(EnvKeys::MAX_CONNECTIONS, connections));
        }

        return config;
    }

    Config load_from_env() {
        return load([](const char* key) -> const char* { return std::getenv(key); });
    }

    void apply(const Config& config) {
        logging::enable(config.log_level_);
        concurrency::select_scheduler(config.scheduler_);
    }
}  // namespace clump::config
