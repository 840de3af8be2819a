#include "net/connection_manager.hpp"

#include <utility>
#include <vector>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/ip/address.hpp>
#include <asio/steady_timer.hpp>

#include "net/log.hpp"

namespace slsk::net {

namespace {

/**
 * @brief State of one outbound connect attempt, shared by the resolver,
 * connect and timer completions
 */
struct PendingConnect
{
    PendingConnect(asio::io_context& io) :
      resolver(io), socket(io), timer(io)
    {
    }

    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    bool done = false;
    bool timed_out = false;
};

}  // namespace

ConnectionManager::ConnectionManager(asio::io_context& io) :
  _io(io), _acceptor(io), _logger(internal_logger())
{
}

ConnectionManager::~ConnectionManager()
{
    asio::error_code ignored;
    _acceptor.close(ignored);
}

auto ConnectionManager::open(
  std::string host,
  uint16_t port,
  proto::FrameKind kind,
  std::chrono::milliseconds timeout,
  ConnectCallback callback
) -> void
{
    auto pending = std::make_shared<PendingConnect>(_io);
    auto finish = [this, pending, kind, callback = std::move(callback)](
                    asio::error_code ec
                  ) {
        if (pending->done) {
            return;
        }
        pending->done = true;
        pending->timer.cancel();

        if (pending->timed_out) {
            ec = asio::error::timed_out;
        }

        if (ec) {
            asio::error_code ignored;
            pending->socket.close(ignored);
            callback(tl::make_unexpected(ec));
            return;
        }

        callback(_adopt(std::move(pending->socket), kind));
    };

    _logger->debug("Connecting to {}:{}", host, port);

    pending->timer.expires_after(timeout);
    pending->timer.async_wait([pending](asio::error_code ec) {
        if (ec or pending->done) {
            return;
        }

        pending->timed_out = true;
        pending->resolver.cancel();

        asio::error_code ignored;
        pending->socket.close(ignored);
    });

    pending->resolver.async_resolve(
      host, std::to_string(port),
      [pending, finish](
        asio::error_code ec, asio::ip::tcp::resolver::results_type endpoints
      ) mutable {
          if (ec or pending->timed_out) {
              finish(ec ? ec : asio::error::timed_out);
              return;
          }

          asio::async_connect(
            pending->socket, endpoints,
            [finish](asio::error_code ec, const asio::ip::tcp::endpoint&) mutable {
                finish(ec);
            }
          );
      }
    );
}

auto ConnectionManager::listen(uint16_t port) -> uint16_t
{
    using asio::ip::tcp;

    if (_listening_port) {
        return *_listening_port;
    }

    const tcp::endpoint endpoint(tcp::v4(), port);

    _acceptor.open(endpoint.protocol());
    _acceptor.set_option(tcp::acceptor::reuse_address(true));
    _acceptor.bind(endpoint);
    _acceptor.listen();

    _listening_port = _acceptor.local_endpoint().port();
    _logger->info("Listening for peers on port {}", *_listening_port);

    _do_accept();

    return *_listening_port;
}

auto ConnectionManager::listening_port() const -> std::optional<uint16_t>
{
    return _listening_port;
}

auto ConnectionManager::on_accept(AcceptCallback callback) -> void
{
    _on_accept = std::move(callback);
}

auto ConnectionManager::close_all() -> void
{
    std::vector<ConnectionPtr> alive;

    {
        std::lock_guard lock(_mutex);
        for (auto& [id, weak] : _connections) {
            if (auto connection = weak.lock()) {
                alive.push_back(std::move(connection));
            }
        }
        _connections.clear();
    }

    _logger->debug("Closing {} connections", alive.size());

    for (auto& connection : alive) {
        connection->close(asio::error::operation_aborted);
    }
}

auto ConnectionManager::open_count() const -> std::size_t
{
    std::lock_guard lock(_mutex);

    std::size_t count = 0;
    for (const auto& [id, weak] : _connections) {
        if (auto connection = weak.lock(); connection and connection->is_open()) {
            count += 1;
        }
    }

    return count;
}

auto ConnectionManager::_do_accept() -> void
{
    _acceptor.async_accept([this](
                             asio::error_code ec, asio::ip::tcp::socket socket
                           ) {
        if (ec == asio::error::operation_aborted or not _acceptor.is_open()) {
            return;
        }

        if (ec) {
            _logger->warn("Accept failed: {}", ec.message());
        }
        else {
            auto connection =
              _adopt(std::move(socket), proto::FrameKind::PeerInit);
            _logger->debug(
              "[{}] Accepted connection from {}", connection->id(),
              connection->remote()
            );

            if (_on_accept) {
                _on_accept(std::move(connection));
            }
        }

        _do_accept();
    });
}

auto ConnectionManager::_adopt(
  asio::ip::tcp::socket socket, proto::FrameKind kind
) -> ConnectionPtr
{
    auto connection =
      std::make_shared<Connection>(std::move(socket), kind, _next_id++);

    std::lock_guard lock(_mutex);

    // drop entries of connections already gone
    std::erase_if(_connections, [](const auto& entry) {
        return entry.second.expired();
    });
    _connections.emplace(connection->id(), connection);

    return connection;
}

}  // namespace slsk::net
