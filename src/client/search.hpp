#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>

#include "client/errors.hpp"
#include "client/peers.hpp"
#include "client/session.hpp"
#include "client/token.hpp"
#include "proto/types.hpp"

namespace slsk::client {

struct SearchResult
{
    std::string username;
    std::string filename;
    uint64_t size = 0;
    std::optional<uint32_t> bitrate;
    std::optional<uint32_t> duration;
    bool slots_free = false;
    uint32_t avg_speed = 0;
    uint32_t queue_length = 0;
};

struct SearchRequest
{
    uint32_t token;
    std::string query;
    std::chrono::steady_clock::time_point issued_at;
    std::size_t limit;
};

/**
 * @brief One result per shared file of a peer reply, locked files excluded
 */
auto to_results(const proto::FileSearchResponse& response)
  -> std::vector<SearchResult>;

/**
 * @brief Free slots first, then faster peers. Stable: equal results keep
 * their arrival order.
 */
auto sort_results(std::vector<SearchResult>& results) -> void;

/**
 * @brief Sorted and truncated to limit
 */
auto rank_results(std::vector<SearchResult> results, std::size_t limit)
  -> std::vector<SearchResult>;

/**
 * @brief Runs searches: one token per search, results collected from every
 * peer during a fixed window
 */
class SearchCoordinator
{
 public:
    using Results = std::vector<SearchResult>;

    SearchCoordinator(
      asio::io_context& io,
      asio::thread_pool& workers,
      Session& session,
      PeerConnections& peers,
      TokenGenerator& tokens
    );

    SearchCoordinator(const SearchCoordinator&) = delete;
    auto operator=(const SearchCoordinator&) -> SearchCoordinator& = delete;

    /**
     * @brief Completes when the window elapses, never earlier. The session
     * must be Ready.
     */
    auto search(
      std::string query,
      std::size_t limit,
      std::chrono::milliseconds window,
      Completion<Results> done
    ) -> void;

    auto outstanding() const -> std::size_t { return _searches.size(); }

 private:
    struct Accumulator
    {
        Accumulator(asio::io_context& io, SearchRequest request) :
          request(std::move(request)), timer(io)
        {
        }

        SearchRequest request;
        Results results;
        asio::steady_timer timer;
        Completion<Results> done;
    };

    auto _on_response(const proto::Frame& frame) -> void;
    auto _add_results(proto::FileSearchResponse response) -> void;
    auto _close_window(uint32_t token) -> void;

    asio::io_context& _io;
    asio::thread_pool& _workers;
    Session& _session;
    TokenGenerator& _tokens;

    std::unordered_map<uint32_t, std::unique_ptr<Accumulator>> _searches;
};

}  // namespace slsk::client
