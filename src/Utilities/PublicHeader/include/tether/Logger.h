/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <source_location>

// For better logging inside lambda functions
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
#  define __FUNCTION__ __PRETTY_FUNCTION__
#endif

#include "PublicHeader.h"

#define TETHER_LOG_LEVEL_TRACE 0
#define TETHER_LOG_LEVEL_DEBUG 1
#define TETHER_LOG_LEVEL_INFO 2
#define TETHER_LOG_LEVEL_WARN 3
#define TETHER_LOG_LEVEL_ERROR 4
#define TETHER_LOG_LEVEL_CRITICAL 5
#define TETHER_LOG_LEVEL_OFF 6

#if !defined(TETHER_LOG_LEVEL)
#  if defined(NDEBUG)
#    define TETHER_LOG_LEVEL TETHER_LOG_LEVEL_INFO
#  else
#    define TETHER_LOG_LEVEL TETHER_LOG_LEVEL_TRACE
#  endif
#endif

#define SPDLOG_ACTIVE_LEVEL TETHER_LOG_LEVEL

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
// std::filesystem::path formatting
#include <fmt/std.h>
#include <spdlog/spdlog.h>

// Must be after the static log level definition
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#define TETHER_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define TETHER_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define TETHER_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define TETHER_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define TETHER_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define TETHER_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Log through a specific logger, e.g. the per-shim logger which carries the
// shim identity as its name.
#define TETHER_LOGGER_TRACE(logger, ...) SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__)
#define TETHER_LOGGER_DEBUG(logger, ...) SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__)
#define TETHER_LOGGER_INFO(logger, ...) SPDLOG_LOGGER_INFO(logger, __VA_ARGS__)
#define TETHER_LOGGER_WARN(logger, ...) SPDLOG_LOGGER_WARN(logger, __VA_ARGS__)
#define TETHER_LOGGER_ERROR(logger, ...) SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__)

std::optional<spdlog::level::level_enum> StrToLogLevel(
    const std::string& level);

// An empty log_file_path leaves out the file sink.
void InitLogger(spdlog::level::level_enum level,
                const std::filesystem::path& log_file_path, bool enable_console,
                uint64_t max_file_size = kDefaultTetherdMaxLogFileSize,
                uint64_t max_file_num = kDefaultTetherdMaxLogFileNum);

/**
 * @brief Create an unregistered logger writing to the sinks of the default
 * logger. The name shows up in the [%n] field of every line, which is how a
 * shim's identity is attached to its log lines without touching any shared
 * logger.
 */
std::shared_ptr<spdlog::logger> CreateChildLogger(const std::string& name);
