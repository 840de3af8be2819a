#include "client/search.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

#include <asio/post.hpp>
#include <magic_enum.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/take.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"

namespace slsk::client {

auto to_results(const proto::FileSearchResponse& response)
  -> std::vector<SearchResult>
{
    return response.files | ranges::views::transform([&](auto&& file) {
               return SearchResult{
                 .username = response.username,
                 .filename = file.filename,
                 .size = file.size,
                 .bitrate = file.attribute(proto::FileAttribute::Bitrate),
                 .duration = file.attribute(proto::FileAttribute::Duration),
                 .slots_free = response.slots_free,
                 .avg_speed = response.avg_speed,
                 .queue_length = response.queue_length,
               };
           }) |
           ranges::to<std::vector<SearchResult>>();
}

auto sort_results(std::vector<SearchResult>& results) -> void
{
    std::ranges::stable_sort(results, [](const auto& lhs, const auto& rhs) {
        if (lhs.slots_free != rhs.slots_free) {
            return lhs.slots_free;
        }
        return lhs.avg_speed > rhs.avg_speed;
    });
}

auto rank_results(std::vector<SearchResult> results, std::size_t limit)
  -> std::vector<SearchResult>
{
    sort_results(results);

    return results | ranges::views::take(limit) |
           ranges::to<std::vector<SearchResult>>();
}

SearchCoordinator::SearchCoordinator(
  asio::io_context& io,
  asio::thread_pool& workers,
  Session& session,
  PeerConnections& peers,
  TokenGenerator& tokens
) :
  _io(io), _workers(workers), _session(session), _tokens(tokens)
{
    peers.subscribe(
      proto::PeerCode::FileSearchResponse,
      [this](const auto&, const auto&, const proto::Frame& frame)
        -> tl::expected<void, proto::Error> {
          _on_response(frame);
          return {};
      }
    );
}

auto SearchCoordinator::search(
  std::string query,
  std::size_t limit,
  std::chrono::milliseconds window,
  Completion<Results> done
) -> void
{
    const auto token = _tokens.next_unused([this](uint32_t token) {
        return _searches.contains(token);
    });

    auto accumulator = std::make_unique<Accumulator>(
      _io, SearchRequest{
             .token = token,
             .query = query,
             .issued_at = std::chrono::steady_clock::now(),
             .limit = limit,
           }
    );

    auto sent = _session.send(proto::pack_file_search(proto::FileSearch{
      .token = token, .query = std::move(query)
    }));
    if (not sent) {
        done(tl::make_unexpected(make_error(
          ErrorKind::SearchFailed, "Can't send search \"{}\": {}",
          accumulator->request.query, sent.error().message()
        )));
        return;
    }

    spdlog::info(
      "Searching \"{}\" (token {}) for {} ms", accumulator->request.query,
      token, window.count()
    );

    accumulator->done = std::move(done);
    accumulator->timer.expires_after(window);
    accumulator->timer.async_wait([this, token](asio::error_code ec) {
        if (not ec) {
            _close_window(token);
        }
    });

    _searches.emplace(token, std::move(accumulator));
}

auto SearchCoordinator::_on_response(const proto::Frame& frame) -> void
{
    // inflating a reply is the slow part, keep it off the event loop
    asio::post(_workers, [this, body = frame.body] {
        tl::expected<proto::FileSearchResponse, proto::Error> response;
        try {
            response = proto::unpack_file_search_response(body);
        } catch (const std::exception& e) {
            spdlog::warn("Search reply dropped: {}", e.what());
            return;
        }

        asio::post(_io, [this, response = std::move(response)]() mutable {
            if (not response) {
                spdlog::warn(
                  "Bad search reply dropped: {}",
                  magic_enum::enum_name(response.error())
                );
                return;
            }

            _add_results(std::move(*response));
        });
    });
}

auto SearchCoordinator::_add_results(proto::FileSearchResponse response) -> void
{
    auto search = _searches.find(response.token);

    if (search == _searches.end()) {
        spdlog::debug(
          "{} results from {} for closed search {} discarded",
          response.files.size(), response.username, response.token
        );
        return;
    }

    auto results = to_results(response);
    auto& accumulated = search->second->results;

    spdlog::debug(
      "{} results from {} for \"{}\"", results.size(), response.username,
      search->second->request.query
    );

    accumulated.insert(
      accumulated.end(), std::make_move_iterator(results.begin()),
      std::make_move_iterator(results.end())
    );
}

auto SearchCoordinator::_close_window(uint32_t token) -> void
{
    auto search = _searches.find(token);
    if (search == _searches.end()) {
        return;
    }

    auto accumulator = std::move(search->second);
    _searches.erase(search);

    spdlog::info(
      "Search \"{}\" closed with {} results", accumulator->request.query,
      accumulator->results.size()
    );

    auto done = std::move(accumulator->done);
    done(rank_results(std::move(accumulator->results), accumulator->request.limit));
}

}  // namespace slsk::client
