#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <map>
#include <stdexcept>
#include <string>

#include "../../src/clump/config/config.hpp"
#include "../../src/utils/constants.hpp"
#include "../../src/utils/logging.hpp"

using clump::AggregateMode;
using clump::config::Config;
using clump::config::EnvKeys;

namespace {
    Config load(const std::map<std::string, std::string>& env) {
        return clump::config::load([&env](const char* key) -> const char* {
            auto it = env.find(key);
            return it == env.end() ? nullptr : it->second.c_str();
        });
    }
}  // namespace

TEST(ConfigTest, DefaultsWhenNothingIsSet) {
    const Config config = load({});

    EXPECT_EQ(config.log_level_, "off");
    EXPECT_EQ(config.dispatcher_.failure_status_, constants::DEFAULT_FAILURE_STATUS);
    EXPECT_EQ(config.dispatcher_.aggregate_mode_, AggregateMode::ALIGNED);
    EXPECT_FALSE(config.dispatcher_.deadline_.has_value());
    EXPECT_EQ(config.scheduler_.kind_, concurrency::SchedulerKind::THREAD_PER_TASK);
    EXPECT_EQ(config.transport_.timeout_.count(), http::client::DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(config.transport_.max_connections_, http::client::DEFAULT_MAX_CONNECTIONS);
}

TEST(ConfigTest, ReadsEveryKey) {
    const Config config = load({
        {EnvKeys::LOG_LEVEL, "debug"},
        {EnvKeys::SCHEDULER, "pool"},
        {EnvKeys::POOL_THREADS, "6"},
        {EnvKeys::FAILURE_STATUS, "418"},
        {EnvKeys::DEADLINE_MS, "2500"},
        {EnvKeys::AGGREGATE, "Segregated"},
        {EnvKeys::CONNECT_TIMEOUT_MS, "700"},
        {EnvKeys::TIMEOUT_MS, "9000"},
        {EnvKeys::MAX_CONNECTIONS, "32"},
    });

    EXPECT_EQ(config.log_level_, "debug");
    EXPECT_EQ(config.scheduler_.kind_, concurrency::SchedulerKind::THREAD_POOL);
    EXPECT_EQ(config.scheduler_.pool_threads_, 6u);
    EXPECT_EQ(config.dispatcher_.failure_status_, 418);
    ASSERT_TRUE(config.dispatcher_.deadline_.has_value());
    EXPECT_EQ(config.dispatcher_.deadline_->count(), 2500);
    EXPECT_EQ(config.dispatcher_.aggregate_mode_, AggregateMode::SEGREGATED);
    EXPECT_EQ(config.transport_.connect_timeout_.count(), 700);
    EXPECT_EQ(config.transport_.timeout_.count(), 9000);
    EXPECT_EQ(config.transport_.max_connections_, 32u);
}

TEST(ConfigTest, RejectsMalformedValues) {
    EXPECT_THROW((void)load({{EnvKeys::LOG_LEVEL, "loud"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::SCHEDULER, "uvloop"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::POOL_THREADS, "0"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::FAILURE_STATUS, "abc"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::FAILURE_STATUS, "42"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::DEADLINE_MS, "-5"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::AGGREGATE, "both"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::TIMEOUT_MS, "10s"}}), std::runtime_error);
    EXPECT_THROW((void)load({{EnvKeys::MAX_CONNECTIONS, "0"}}), std::runtime_error);
}

TEST(ConfigTest, FailureStatusZeroIsAllowed) {
    const Config config = load({{EnvKeys::FAILURE_STATUS, "0"}});

    EXPECT_EQ(config.dispatcher_.failure_status_, 0);
}

TEST(LoggingTest, LoggerStartsDisabled) {
    auto logger = logging::logger();

    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "clump");
    EXPECT_EQ(logger->level(), spdlog::level::off);

    logging::enable("warn");
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    logging::disable();
    EXPECT_EQ(logger->level(), spdlog::level::off);
}

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_level("TRACE"), spdlog::level::trace);
    EXPECT_EQ(logging::parse_level(" error "), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("warning"), spdlog::level::warn);
    EXPECT_THROW((void)logging::parse_level("verbose"), std::runtime_error);
}

TEST(LoggingTest, KeepsLevelOfLoggerRegisteredByApplication) {
    auto preset = spdlog::stderr_color_mt("clump-preset");
    preset->set_level(spdlog::level::info);

    auto attached = logging::attach_logger("clump-preset");
    auto created = logging::attach_logger("clump-fresh");

    EXPECT_EQ(attached, preset);
    EXPECT_EQ(attached->level(), spdlog::level::info);
    EXPECT_EQ(created->level(), spdlog::level::off);

    spdlog::drop("clump-preset");
    spdlog::drop("clump-fresh");
}
