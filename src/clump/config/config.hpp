#ifndef CLUMP_CONFIG_HPP
#define CLUMP_CONFIG_HPP

#include <functional>
#include <string>

#include "../../http/client/curl_easy.hpp"
#include "../../utils/executor.hpp"
#include "../dispatcher/dispatcher.hpp"

namespace clump::config {

    struct EnvKeys {
        static constexpr const char* LOG_LEVEL = "CLUMP_LOG_LEVEL";
        static constexpr const char* SCHEDULER = "CLUMP_SCHEDULER";
        static constexpr const char* POOL_THREADS = "CLUMP_POOL_THREADS";
        static constexpr const char* FAILURE_STATUS = "CLUMP_FAILURE_STATUS";
        static constexpr const char* DEADLINE_MS = "CLUMP_DEADLINE_MS";
        static constexpr const char* AGGREGATE = "CLUMP_AGGREGATE";
        static constexpr const char* CONNECT_TIMEOUT_MS = "CLUMP_CONNECT_TIMEOUT_MS";
        static constexpr const char* TIMEOUT_MS = "CLUMP_TIMEOUT_MS";
        static constexpr const char* MAX_CONNECTIONS = "CLUMP_MAX_CONNECTIONS";
    };

    struct Config {
        std::string log_level_ = "off";
        DispatcherOptions dispatcher_;
        http::client::TransportOptions transport_;
        concurrency::SchedulerOptions scheduler_;
    };

    // Returns nullptr for unset keys.
    using EnvLookup = std::function<const char*(const char*)>;

    // Throws std::runtime_error on malformed values.
    [[nodiscard]] Config load(const EnvLookup& lookup);
    [[nodiscard]] Config load_from_env();

    // Process-start wiring: logger level and the default scheduler.
    void apply(const Config& config);
}  // namespace clump::config

#endif
