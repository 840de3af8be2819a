#include <algorithm>
#include <cassert>
#include <chrono>
#include <iterator>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "client/client.hpp"
#include "client/search.hpp"
#include "proto/types.hpp"
#include "tests/tests.hpp"

using namespace slsk;
using namespace slsk::testing;
using client::SearchResult;
using proto::ServerCode;

namespace {

auto result(std::string filename, bool slots_free, uint32_t avg_speed)
  -> SearchResult
{
    return SearchResult{
      .username = "peer",
      .filename = std::move(filename),
      .size = 1024,
      .slots_free = slots_free,
      .avg_speed = avg_speed,
    };
}

auto shared_file(std::string filename, uint64_t size) -> proto::SharedFile
{
    return proto::SharedFile{
      .filename = std::move(filename),
      .size = size,
      .extension = "mp3",
      .attributes = {{uint32_t(proto::FileAttribute::Bitrate), 320}},
    };
}

}  // namespace

void test_rank_results();
void test_to_results();
void test_zero_limit_skips_network();
void test_empty_window();
void test_results_from_peers();
void test_late_results_dropped();

void search_tests()
{
    test_rank_results();
    test_to_results();
    test_zero_limit_skips_network();
    test_empty_window();
    test_results_from_peers();
    test_late_results_dropped();

    spdlog::debug("Search tests passed");
}

void test_rank_results()
{
    std::vector<SearchResult> results{
      result("a", false, 900), result("b", true, 10), result("c", true, 500),
      result("d", false, 900), result("e", true, 10),
    };

    {
        auto ranked = client::rank_results(results, 50);
        assert(ranked.size() == 5);

        // free slots together, fastest first, ties in arrival order
        std::vector<std::string> order;
        std::ranges::transform(ranked, std::back_inserter(order), &SearchResult::filename);
        assert((order == std::vector<std::string>{"c", "b", "e", "a", "d"}));
    }

    {
        auto ranked = client::rank_results(results, 2);
        assert(ranked.size() == 2);
        assert(ranked[0].filename == "c");
        assert(ranked[1].filename == "b");
    }

    assert(client::rank_results(results, 0).empty());
    assert(client::rank_results({}, 10).empty());
}

void test_to_results()
{
    proto::FileSearchResponse response{
      .username = "alice",
      .token = 1,
      .files = {shared_file("a.mp3", 100), shared_file("b.mp3", 200)},
      .slots_free = true,
      .avg_speed = 4096,
      .queue_length = 2,
      .locked_files = {shared_file("locked.mp3", 300)},
    };
    response.files[1].attributes.emplace_back(
      uint32_t(proto::FileAttribute::Duration), 185
    );

    auto results = client::to_results(response);
    assert(results.size() == 2);

    assert(results[0].username == "alice");
    assert(results[0].filename == "a.mp3");
    assert(results[0].size == 100);
    assert(results[0].bitrate == 320u);
    assert(not results[0].duration);
    assert(results[0].slots_free);
    assert(results[0].avg_speed == 4096);
    assert(results[0].queue_length == 2);

    assert(results[1].duration == 185u);
}

void test_zero_limit_skips_network()
{
    FakeServer server;
    client::Client client(client_config(server, scratch_dir("zero-limit")));

    assert(client.search("anything", 0).empty());
    assert(client.search("anything", -3).empty());

    assert(not client.status().connected);
    assert(server.count(ServerCode::Login) == 0);
    assert(server.count(ServerCode::FileSearch) == 0);
}

void test_empty_window()
{
    FakeServer server;
    client::Client client(client_config(server, scratch_dir("empty-window")));

    const auto started = std::chrono::steady_clock::now();
    auto results = client.search("nobody shares this", 10, 300ms);

    assert(results.empty());
    assert(std::chrono::steady_clock::now() - started >= 300ms);
    assert(server.count(ServerCode::FileSearch) == 1);

    auto search = server.last_search();
    assert(search);
    assert(search->query == "nobody shares this");
    assert(search->token != 0);
}

void test_results_from_peers()
{
    FakeServer server;
    FakePeer busy("busy", "", FakePeer::Behaviour::Serve);
    FakePeer idle("idle", "", FakePeer::Behaviour::Serve);

    client::Client client(client_config(server, scratch_dir("results")));
    client.connect();

    busy.set_client_port(*client.listening_port());
    idle.set_client_port(*client.listening_port());

    server.on_search([&](uint32_t token, std::string) {
        busy.send_search_results(
          token, {shared_file("busy/one.mp3", 1), shared_file("busy/two.mp3", 2)},
          false, 90000
        );
        idle.send_search_results(token, {shared_file("idle/one.mp3", 3)}, true, 50);
    });

    {
        auto results = client.search("one", 10, 1s);
        assert(results.size() == 3);

        assert(results[0].username == "idle");
        assert(results[0].filename == "idle/one.mp3");
        assert(results[0].slots_free);

        assert(results[1].username == "busy");
        assert(results[1].filename == "busy/one.mp3");
        assert(results[2].filename == "busy/two.mp3");
    }

    {
        auto results = client.search("one", 1, 1s);
        assert(results.size() == 1);
        assert(results[0].username == "idle");
    }
}

void test_late_results_dropped()
{
    FakeServer server;
    FakePeer late("late", "", FakePeer::Behaviour::Serve);

    client::Client client(client_config(server, scratch_dir("late")));
    client.connect();
    late.set_client_port(*client.listening_port());

    assert(client.search("first", 10, 200ms).empty());

    auto first = server.last_search();
    assert(first);

    // replies for the closed search, then for the next one
    server.on_search([&](uint32_t token, std::string) {
        late.send_search_results(first->token, {shared_file("stale.mp3", 1)}, true, 1);
        late.send_search_results(token, {shared_file("fresh.mp3", 1)}, true, 1);
    });

    auto results = client.search("second", 10, 1s);
    assert(results.size() == 1);
    assert(results[0].filename == "fresh.mp3");
}
