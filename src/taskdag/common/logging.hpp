/**
 * @file logging.hpp
 * @brief Process-wide spdlog logger used by taskdag.
 */
#pragma once
#include "taskdag/common/common.hpp"
#include <spdlog/spdlog.h>

namespace taskdag
{

/// Name under which the logger is registered with spdlog.
inline constexpr const char* kLoggerName = "taskdag";

/**
 * @brief Get the shared taskdag logger.
 *
 * @details
 * Returns the logger registered as `kLoggerName`, creating it with a
 * colored stderr sink on first use. Applications may register their own
 * logger under that name before the first call to redirect output.
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace taskdag
