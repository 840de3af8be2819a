#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/thread_pool.hpp>

#include "client/config.hpp"
#include "client/errors.hpp"
#include "client/peers.hpp"
#include "client/search.hpp"
#include "client/session.hpp"
#include "client/token.hpp"
#include "client/transfer.hpp"
#include "net/connection_manager.hpp"

namespace slsk::client {

/**
 * @brief Soulseek client: search, download and status over one session
 *
 * Owns the event loop thread and every protocol component. Calls block the
 * caller until the operation completes and throw slsk::Error. Operations
 * that need the network log in first when the session is not Ready.
 */
class Client
{
 public:
    constexpr static int DEFAULT_SEARCH_LIMIT = 50;
    constexpr static std::size_t DECODE_WORKERS = 2;

    explicit Client(Config config);
    ~Client();

    Client(const Client&) = delete;
    auto operator=(const Client&) -> Client& = delete;

    /**
     * @brief Results sorted by free slot then speed. A limit of zero or
     * less returns nothing without touching the network.
     */
    auto search(
      std::string query,
      int limit = DEFAULT_SEARCH_LIMIT,
      std::optional<std::chrono::milliseconds> window = std::nullopt
    ) -> std::vector<SearchResult>;

    /**
     * @brief Download a file shared by a peer into the download path.
     * The progress callback runs on the event loop thread.
     */
    auto download(std::string username, std::string filename, ProgressCb progress = {})
      -> DownloadResult;

    auto status() const -> Session::Status;

    auto connect() -> void;
    auto disconnect() -> void;

    auto config() const -> const Config& { return _config; }
    auto listening_port() const -> std::optional<uint16_t>;

 private:
    template<typename T>
    auto _run(std::function<void(Completion<T>)> operation) -> T;

    /**
     * @brief Lazy connect guard. Runs on the event loop.
     */
    auto _ensure_connected(Completion<void> next) -> void;

    /**
     * @brief Close every connection and fail every operation waiting on one
     */
    auto _drop_everything() -> void;

    Config _config;

    asio::io_context _io;
    asio::executor_work_guard<asio::io_context::executor_type> _work;
    asio::thread_pool _workers;

    TokenGenerator _tokens;
    net::ConnectionManager _connections;
    Session _session;
    PeerConnections _peers;
    SearchCoordinator _searches;
    TransferManager _transfers;

    std::jthread _loop;
};

}  // namespace slsk::client
