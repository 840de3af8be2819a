#include "client/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <tuple>

#include <spdlog/spdlog.h>

#include "client/errors.hpp"
#include "misc/parse_ip_port.hpp"
#include "misc/tools.hpp"

namespace slsk::client {

namespace {

auto env(const char* name) -> std::optional<std::string>
{
    const char* value = std::getenv(name);

    if (value == nullptr or std::string_view(value).empty()) {
        return std::nullopt;
    }

    return std::string(value);
}

}  // namespace

auto Config::from_env() -> Config
{
    Config config;

    config.username = env("SOULSEEK_USERNAME");
    config.password = env("SOULSEEK_PASSWORD");

    if (auto path = env("DOWNLOAD_PATH")) {
        config.download_path = *path;
    }

    if (auto server = env("SOULSEEK_SERVER")) {
        try {
            std::tie(config.server_host, config.server_port) =
              utils::parse_host_port(*server);
        } catch (const std::invalid_argument& e) {
            throw Error(
              ErrorKind::Configuration,
              fmt::format("SOULSEEK_SERVER: {}", e.what())
            );
        }
    }

    if (auto port_str = env("SOULSEEK_LISTEN_PORT")) {
        auto port = utils::to_integer<uint16_t>(*port_str);
        if (not port) {
            throw Error(
              ErrorKind::Configuration,
              fmt::format("SOULSEEK_LISTEN_PORT: not a port: {}", *port_str)
            );
        }
        config.listen_port = *port;
    }

    spdlog::debug(
      "Config: server {}:{}, listen port {}, downloads to {}",
      config.server_host, config.server_port, config.listen_port,
      config.download_path.string()
    );

    return config;
}

auto Config::credential() const -> Credential
{
    if (not username or not password) {
        throw Error(
          ErrorKind::Configuration,
          "SOULSEEK_USERNAME and SOULSEEK_PASSWORD must be set"
        );
    }

    return Credential{.username = *username, .password = *password};
}

}  // namespace slsk::client
