#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace slsk::client {

struct Credential
{
    std::string username;
    std::string password;
};

/**
 * @brief Process configuration, read once from the environment
 */
struct Config
{
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::filesystem::path download_path = "downloads";

    std::string server_host = "server.slsknet.org";
    uint16_t server_port = 2242;
    uint16_t listen_port = 2234;  // 0 picks any free port

    std::chrono::milliseconds login_timeout = std::chrono::seconds(30);
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
    std::chrono::milliseconds search_window = std::chrono::seconds(10);
    std::chrono::milliseconds transfer_timeout = std::chrono::minutes(10);
    std::chrono::milliseconds stall_timeout = std::chrono::seconds(60);
    std::chrono::milliseconds keepalive_interval = std::chrono::seconds(30);
    std::chrono::milliseconds liveness_timeout = std::chrono::minutes(15);

    /**
     * @brief SOULSEEK_USERNAME, SOULSEEK_PASSWORD, DOWNLOAD_PATH,
     * SOULSEEK_SERVER (host:port) and SOULSEEK_LISTEN_PORT
     *
     * Throws a Configuration error on malformed values. Missing credentials
     * are only reported by credential().
     */
    static auto from_env() -> Config;

    /**
     * @brief Credentials for login, Configuration error when missing
     */
    auto credential() const -> Credential;
};

}  // namespace slsk::client
