/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/error/MoneyError.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

//-------------------------------------------------------------------------

namespace finmoney::log
{

inline constexpr const char* kLoggerName = "finmoney";

/**
 * Library-wide logger, created on first use with a stderr sink at warn level.
 * Only construction, configuration and deserialization paths write to it.
 */
[[nodiscard]] spdlog::logger& logger();

void setLevel(spdlog::level::level_enum level);

/**
 * Routes the library logger to a file appending at filepath, replacing the
 * current sink. Safe to call while other threads log. When the file cannot
 * be opened the current sink stays in place and INVALID_CONFIG is returned.
 */
[[nodiscard]] Result<void> setFileSink(const std::filesystem::path& filepath);

}  // namespace finmoney::log

//-------------------------------------------------------------------------
