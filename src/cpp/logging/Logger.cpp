/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/logging/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney::log
{

//-------------------------------------------------------------------------

namespace
{

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// The logger writes through a single dist_sink_mt so that swapping the
// destination happens under the sink's own mutex.
struct LoggerState
{
    std::shared_ptr<spdlog::sinks::dist_sink_mt> sink;
    std::shared_ptr<spdlog::logger> logger;
};

LoggerState& state()
{
    static LoggerState s_state = [] {
        auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
        sink->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern(kPattern);
        return LoggerState{std::move(sink), std::move(logger)};
    }();
    return s_state;
}

}  // namespace

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    return *state().logger;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

//-------------------------------------------------------------------------

Result<void> setFileSink(const std::filesystem::path& filepath)
{
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> fileSink;
    try {
        fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string());
    }
    catch (const spdlog::spdlog_ex& e) {
        auto err = MoneyError::invalidConfig(
            fmt::format("cannot log to '{}': {}", filepath.string(), e.what()));
        logger().warn("{}", err.toString());
        return std::unexpected{std::move(err)};
    }
    fileSink->set_pattern(kPattern);

    auto& [sink, log] = state();
    log->flush();
    sink->set_sinks({std::move(fileSink)});
    return {};
}

//-------------------------------------------------------------------------

}  // namespace finmoney::log

//-------------------------------------------------------------------------
