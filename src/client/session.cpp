#include "client/session.hpp"

#include <exception>
#include <utility>

#include <asio/error.hpp>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"

namespace slsk::client {

Session::Session(
  asio::io_context& io, net::ConnectionManager& connections, const Config& config
) :
  _connections(connections),
  _config(config),
  _login_timer(io),
  _keepalive_timer(io)
{
}

auto Session::login(Credential credential, Completion<void> done) -> void
{
    if (state() == State::Ready) {
        done({});
        return;
    }

    _waiters.push_back(std::move(done));

    if (state() == State::Authenticating) {
        spdlog::debug("Login already in progress, waiting for it");
        return;
    }

    _set_state(State::Authenticating);
    _credential = std::move(credential);
    const auto generation = ++_generation;

    spdlog::info(
      "Connecting to {}:{} as {}", _config.server_host, _config.server_port,
      _credential->username
    );

    _connections.open(
      _config.server_host, _config.server_port, proto::FrameKind::Server,
      _config.connect_timeout,
      [this, generation](auto&& result) {
          if (generation != _generation) {
              if (result) {
                  (*result)->close();
              }
              return;
          }

          if (not result) {
              _fail_login(make_error(
                ErrorKind::Connection, "Can't connect to server {}:{}: {}",
                _config.server_host, _config.server_port, result.error().message()
              ));
              return;
          }

          _on_connected(std::move(*result));
      }
    );
}

auto Session::disconnect() -> void
{
    if (state() == State::Authenticating) {
        _fail_login(make_error(ErrorKind::Connection, "Disconnected during login"));
        return;
    }

    if (state() == State::Ready) {
        spdlog::info("Disconnecting from server");
    }

    _drop_connection();
    _set_state(State::Disconnected);
}

auto Session::send(std::vector<uint8_t> message)
  -> tl::expected<void, asio::error_code>
{
    if (not _connection) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    return _connection->send(std::move(message));
}

auto Session::subscribe(proto::ServerCode code, ServerHandler handler) -> void
{
    _handlers[static_cast<uint32_t>(code)] = std::move(handler);
}

auto Session::on_state_change(StateHandler handler) -> void
{
    _on_state_change = std::move(handler);
}

auto Session::state() const -> State
{
    std::lock_guard lock(_mutex);
    return _state;
}

auto Session::status() const -> Status
{
    std::lock_guard lock(_mutex);
    return Status{.connected = _state == State::Ready, .username = _username};
}

auto Session::_on_connected(std::shared_ptr<net::Connection> connection) -> void
{
    const auto generation = _generation;

    _connection = std::move(connection);
    _connection->on_frame([this](const proto::Frame& frame) {
        return _on_frame(frame);
    });
    _connection->on_close([this, generation](asio::error_code ec) {
        if (generation == _generation) {
            _on_closed(ec);
        }
    });
    _connection->start();

    _last_activity = std::chrono::steady_clock::now();

    tl::expected<void, asio::error_code> sent;
    try {
        sent = send(proto::pack_login(proto::LoginRequest{
          .username = _credential->username, .password = _credential->password
        }));
    } catch (const std::exception& e) {
        spdlog::error("Can't build login request: {}", e.what());
        _fail_login(make_error(
          ErrorKind::Configuration, "Can't build login request: {}", e.what()
        ));
        return;
    }

    if (not sent) {
        _fail_login(make_error(
          ErrorKind::Connection, "Can't send login: {}", sent.error().message()
        ));
        return;
    }

    _login_timer.expires_after(_config.login_timeout);
    _login_timer.async_wait([this, generation](asio::error_code ec) {
        if (ec or generation != _generation) {
            return;
        }

        _fail_login(make_error(
          ErrorKind::AuthenticationFailed, "Login timed out after {} ms",
          _config.login_timeout.count()
        ));
    });
}

auto Session::_on_frame(const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    _last_activity = std::chrono::steady_clock::now();

    const auto code = static_cast<proto::ServerCode>(frame.code);

    if (state() == State::Authenticating) {
        if (code == proto::ServerCode::Login) {
            return _on_login_response(frame);
        }

        spdlog::debug(
          "Server message {} before login ignored", magic_enum::enum_name(code)
        );
        return {};
    }

    if (code == proto::ServerCode::Relogged) {
        spdlog::warn("Logged in from another place, server connection dropped");
        _drop_connection();
        _set_state(State::Disconnected);
        return {};
    }

    auto handler = _handlers.find(frame.code);
    if (handler == _handlers.end()) {
        spdlog::trace("Server message {} ignored", magic_enum::enum_name(code));
        return {};
    }

    return handler->second(frame);
}

auto Session::_on_login_response(const proto::Frame& frame)
  -> tl::expected<void, proto::Error>
{
    auto response = proto::unpack_login_response(frame.body);

    if (not response) {
        _fail_login(make_error(
          ErrorKind::MalformedMessage, "Bad login response: {}",
          magic_enum::enum_name(response.error())
        ));
        return {};
    }

    if (not response->success) {
        _fail_login(make_error(
          ErrorKind::AuthenticationFailed, "Login rejected: {}", response->reason
        ));
        return {};
    }

    _login_timer.cancel();

    spdlog::info("Logged in as {}", _credential->username);
    if (not response->greeting.empty()) {
        spdlog::info("Server: {}", response->greeting);
    }

    _set_state(State::Ready, _credential->username);
    _announce();
    _start_keepalive();
    _complete_waiters({});

    return {};
}

auto Session::_on_closed(asio::error_code ec) -> void
{
    _connection.reset();
    ++_generation;

    if (state() == State::Authenticating) {
        _fail_login(make_error(
          ErrorKind::Connection, "Server closed the connection during login: {}",
          ec ? ec.message() : "end of stream"
        ));
        return;
    }

    spdlog::warn(
      "Connection to server lost: {}", ec ? ec.message() : "end of stream"
    );
    _keepalive_timer.cancel();
    _set_state(State::Disconnected);
}

auto Session::_announce() -> void
{
    std::vector<std::vector<uint8_t>> messages;

    if (auto port = _connections.listening_port()) {
        messages.push_back(proto::pack_set_wait_port(*port));
    }
    messages.push_back(proto::pack_set_status(proto::UserStatus::Online));
    messages.push_back(proto::pack_shared_folders_files(0, 0));
    messages.push_back(proto::pack_have_no_parent(true));

    for (auto& message : messages) {
        if (auto sent = send(std::move(message)); not sent) {
            spdlog::warn("Can't announce client state: {}", sent.error().message());
            return;
        }
    }
}

auto Session::_start_keepalive() -> void
{
    _keepalive_timer.expires_after(_config.keepalive_interval);
    _keepalive_timer.async_wait([this, generation = _generation](auto ec) {
        if (generation == _generation) {
            _on_keepalive(ec);
        }
    });
}

auto Session::_on_keepalive(asio::error_code ec) -> void
{
    if (ec or state() != State::Ready) {
        return;
    }

    const auto silence = std::chrono::steady_clock::now() - _last_activity;

    if (silence > _config.liveness_timeout) {
        spdlog::warn(
          "Server silent for {} s, connection lost",
          std::chrono::duration_cast<std::chrono::seconds>(silence).count()
        );
        _drop_connection();
        _set_state(State::Disconnected);
        return;
    }

    if (auto sent = send(proto::pack_server_ping()); not sent) {
        spdlog::warn("Keep-alive failed: {}", sent.error().message());
        _drop_connection();
        _set_state(State::Disconnected);
        return;
    }

    _start_keepalive();
}

auto Session::_set_state(State state, std::optional<std::string> username)
  -> void
{
    {
        std::lock_guard lock(_mutex);
        if (_state == state) {
            return;
        }

        _state = state;
        _username = std::move(username);
    }

    spdlog::debug("Session state: {}", magic_enum::enum_name(state));

    if (_on_state_change) {
        _on_state_change(state);
    }
}

auto Session::_fail_login(std::exception_ptr error) -> void
{
    _drop_connection();
    _set_state(State::Disconnected);
    _complete_waiters(tl::make_unexpected(std::move(error)));
}

auto Session::_drop_connection() -> void
{
    ++_generation;

    _login_timer.cancel();
    _keepalive_timer.cancel();

    if (_connection) {
        _connection->close();
        _connection.reset();
    }
}

auto Session::_complete_waiters(Result<void> result) -> void
{
    auto waiters = std::move(_waiters);
    _waiters.clear();

    for (auto& waiter : waiters) {
        waiter(result);
    }
}

}  // namespace slsk::client
