#ifndef CLUMP_LOGGING_HPP
#define CLUMP_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace logging {
    // The "clump" logger starts at level off, so a consuming application sees nothing until it opts in.
    // A "clump" logger the application registered beforehand is used as-is.
    std::shared_ptr<spdlog::logger> logger();

    // Returns the registered logger of that name, or registers a new stderr logger at level off.
    std::shared_ptr<spdlog::logger> attach_logger(const std::string& name);

    void set_level(spdlog::level::level_enum level);

    // Accepts trace, debug, info, warn, error, critical, off. Throws std::runtime_error otherwise.
    spdlog::level::level_enum parse_level(const std::string& name);

    void enable(const std::string& level_name);

    void disable();
}  // namespace logging

#endif
