#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "client/config.hpp"
#include "client/errors.hpp"
#include "tests/fake_network.hpp"

void codec_tests();
void connection_tests();
void session_tests();
void search_tests();
void transfer_tests();
void format_tests();
void cli_tests();

namespace slsk::testing {

/**
 * @brief Fresh empty directory under the system temp directory
 */
inline auto scratch_dir(const std::string& name) -> std::filesystem::path
{
    std::random_device random;
    auto dir = std::filesystem::temp_directory_path() /
               fmt::format("slsk-tests-{}-{:08x}", name, random());

    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

/**
 * @brief Client configuration pointing at a fake server, short timeouts
 */
inline auto client_config(
  const FakeServer& server, const std::filesystem::path& downloads
) -> client::Config
{
    client::Config config;
    config.username = "tester";
    config.password = "secret";
    config.download_path = downloads;

    config.server_host = "127.0.0.1";
    config.server_port = server.port();
    config.listen_port = 0;

    config.login_timeout = 2s;
    config.connect_timeout = 2s;
    config.search_window = 500ms;
    config.transfer_timeout = 3s;
    config.stall_timeout = 2s;

    return config;
}

/**
 * @brief The slsk::Error thrown by fn, if any
 */
template<typename Fn>
auto caught_error(Fn&& fn) -> std::optional<Error>
{
    try {
        fn();
    } catch (const Error& e) {
        return e;
    }

    return std::nullopt;
}

/**
 * @brief Poll until pred holds or the timeout runs out
 */
template<typename Pred>
auto eventually(Pred&& pred, std::chrono::milliseconds timeout = 5s) -> bool
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (not pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }

    return true;
}

}  // namespace slsk::testing
