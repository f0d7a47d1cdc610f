#pragma once

#include <memory>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace peerwire::log {

constexpr const char* LOGGER_NAME = "peerwire";

/**
 * @brief Project logger if registered, spdlog default logger otherwise
 */
inline auto logger() -> std::shared_ptr<spdlog::logger>
{
    if (auto registered = spdlog::get(LOGGER_NAME)) {
        return registered;
    }
    return spdlog::default_logger();
}

}  // namespace peerwire::log
