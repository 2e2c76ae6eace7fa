#pragma once

/// @file logging.hpp
/// @brief Library logger

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace episode_title {

/// Name of the library logger in the spdlog registry
constexpr const char* kLoggerName = "episode_title";

/// @brief Returns the library logger, creating a stderr logger on first use
///
/// A logger registered under kLoggerName by the host application is used as is.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Sets the level of the library logger from an spdlog level name
void set_log_level(const std::string& level);

}  // namespace episode_title
