#include "client/client.hpp"

#include <exception>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <asio/post.hpp>
#include <asio/system_error.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace slsk::client {

template<typename T>
auto Client::_run(std::function<void(Completion<T>)> operation) -> T
{
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    asio::post(_io, [promise, operation = std::move(operation)] {
        auto complete = [promise](Result<T> result) {
            if (not result) {
                promise->set_exception(result.error());
            }
            else if constexpr (std::is_void_v<T>) {
                promise->set_value();
            }
            else {
                promise->set_value(std::move(*result));
            }
        };

        try {
            operation(complete);
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });

    return future.get();
}

Client::Client(Config config) :
  _config(std::move(config)),
  _work(asio::make_work_guard(_io)),
  _workers(DECODE_WORKERS),
  _connections(_io),
  _session(_io, _connections, _config),
  _peers(_io, _connections, _session, _tokens, _config),
  _searches(_io, _workers, _session, _peers, _tokens),
  _transfers(_io, _peers, _config)
{
    _session.on_state_change([this](Session::State state) {
        if (state == Session::State::Disconnected) {
            _peers.reset();
            _transfers.abort_negotiations("server connection lost");
        }
    });

    _loop = std::jthread([this] {
        for (;;) {
            try {
                _io.run();
                break;
            } catch (const std::exception& e) {
                spdlog::error(
                  "Event loop handler failed: {}, dropping all connections",
                  e.what()
                );
                asio::post(_io, [this] { _drop_everything(); });
            }
        }
    });
}

Client::~Client()
{
    try {
        _run<void>([this](Completion<void> done) {
            _drop_everything();
            done({});
        });
    } catch (const std::exception& e) {
        spdlog::warn("Shutdown: {}", e.what());
    }

    _workers.stop();
    _workers.join();

    _work.reset();
    _io.stop();
}

auto Client::search(
  std::string query, int limit, std::optional<std::chrono::milliseconds> window
) -> std::vector<SearchResult>
{
    if (limit <= 0) {
        return {};
    }

    return _run<SearchCoordinator::Results>(
      [this, query = std::move(query), limit,
       window = window.value_or(_config.search_window)](auto done) {
          _ensure_connected([this, query, limit, window, done](auto connected) {
              if (not connected) {
                  done(tl::make_unexpected(connected.error()));
                  return;
              }

              _searches.search(query, std::size_t(limit), window, done);
          });
      }
    );
}

auto Client::download(std::string username, std::string filename, ProgressCb progress)
  -> DownloadResult
{
    return _run<DownloadResult>(
      [this, username = std::move(username), filename = std::move(filename),
       progress = std::move(progress)](auto done) {
          _ensure_connected(
            [this, username, filename, progress, done](auto connected) {
                if (not connected) {
                    done(tl::make_unexpected(connected.error()));
                    return;
                }

                _transfers.download(username, filename, progress, done);
            }
          );
      }
    );
}

auto Client::status() const -> Session::Status
{
    return _session.status();
}

auto Client::connect() -> void
{
    _run<void>([this](auto done) {
        _ensure_connected(done);
    });
}

auto Client::disconnect() -> void
{
    _run<void>([this](auto done) {
        _drop_everything();
        done({});
    });
}

auto Client::listening_port() const -> std::optional<uint16_t>
{
    return _connections.listening_port();
}

auto Client::_drop_everything() -> void
{
    _session.disconnect();

    // a session already down does not report the transition again
    _peers.reset();
    _transfers.abort_negotiations("client disconnected");
    _connections.close_all();
}

auto Client::_ensure_connected(Completion<void> next) -> void
{
    if (_session.state() == Session::State::Ready) {
        next({});
        return;
    }

    auto credential = _config.credential();

    if (not _connections.listening_port()) {
        try {
            _connections.listen(_config.listen_port);
        } catch (const asio::system_error& e) {
            throw Error(
              ErrorKind::Configuration,
              fmt::format("Can't listen on port {}: {}", _config.listen_port, e.what())
            );
        }
    }

    _session.login(std::move(credential), std::move(next));
}

}  // namespace slsk::client
