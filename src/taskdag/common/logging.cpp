/**
 * @file logging.cpp
 */
#include "taskdag/common/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace taskdag
{

std::shared_ptr<spdlog::logger> get_logger()
{
    static std::mutex s_mutex;
    std::lock_guard<std::mutex> lock(s_mutex);

    auto logger = spdlog::get(kLoggerName);
    if (!logger)
    {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // namespace taskdag
