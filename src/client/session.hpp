#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include "client/config.hpp"
#include "client/errors.hpp"
#include "net/connection.hpp"
#include "net/connection_manager.hpp"
#include "proto/types.hpp"

namespace slsk::client {

/**
 * @brief The one logged-in connection to the Soulseek server
 *
 * Disconnected -> Authenticating -> Ready -> Disconnected. Only the session
 * changes its state; state() and status() may be read from any thread,
 * everything else runs on the event loop.
 */
class Session
{
 public:
    enum class State
    {
        Disconnected,
        Authenticating,
        Ready,
    };

    struct Status
    {
        bool connected = false;
        std::optional<std::string> username;
    };

    using ServerHandler = net::Connection::FrameHandler;
    using StateHandler = std::function<void(State)>;

    Session(
      asio::io_context& io, net::ConnectionManager& connections, const Config& config
    );

    Session(const Session&) = delete;
    auto operator=(const Session&) -> Session& = delete;

    /**
     * @brief Connect and authenticate. Calls made while a login is in
     * flight share its outcome; calls made in Ready complete at once.
     */
    auto login(Credential credential, Completion<void> done) -> void;

    /**
     * @brief Close the server connection, failing a login in flight
     */
    auto disconnect() -> void;

    auto send(std::vector<uint8_t> message) -> tl::expected<void, asio::error_code>;

    /**
     * @brief Route every server message with this code to the handler
     */
    auto subscribe(proto::ServerCode code, ServerHandler handler) -> void;
    auto on_state_change(StateHandler handler) -> void;

    auto state() const -> State;
    auto status() const -> Status;

 private:
    auto _on_connected(std::shared_ptr<net::Connection> connection) -> void;
    auto _on_frame(const proto::Frame& frame) -> tl::expected<void, proto::Error>;
    auto _on_login_response(const proto::Frame& frame)
      -> tl::expected<void, proto::Error>;
    auto _on_closed(asio::error_code ec) -> void;

    auto _announce() -> void;
    auto _start_keepalive() -> void;
    auto _on_keepalive(asio::error_code ec) -> void;

    auto _set_state(State state, std::optional<std::string> username = {}) -> void;
    auto _fail_login(std::exception_ptr error) -> void;
    auto _drop_connection() -> void;
    auto _complete_waiters(Result<void> result) -> void;

    net::ConnectionManager& _connections;
    const Config& _config;

    mutable std::mutex _mutex;  // guards _state and _username
    State _state = State::Disconnected;
    std::optional<std::string> _username;

    std::optional<Credential> _credential;
    std::shared_ptr<net::Connection> _connection;
    uint64_t _generation = 0;  // bumped whenever the connection is dropped
    std::vector<Completion<void>> _waiters;

    asio::steady_timer _login_timer;
    asio::steady_timer _keepalive_timer;
    std::chrono::steady_clock::time_point _last_activity;

    std::unordered_map<uint32_t, ServerHandler> _handlers;
    StateHandler _on_state_change;
};

}  // namespace slsk::client
