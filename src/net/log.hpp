#pragma once

#include <memory>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace slsk::net {

/**
 * @brief Logger of the network layer. Registered by the application, created
 * on first use otherwise (tests, library users).
 */
inline auto internal_logger() -> std::shared_ptr<spdlog::logger>
{
    static auto logger = [] {
        if (auto registered = spdlog::get("internal_logger")) {
            return registered;
        }

        auto created = spdlog::stderr_color_mt("internal_logger");
        created->set_level(spdlog::level::warn);
        return created;
    }();

    return logger;
}

}  // namespace slsk::net
