#include <cassert>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "cli_args.hpp"
#include "tests/tests.hpp"

using namespace std::chrono_literals;
using slsk::cli::parse_search_args;

void test_search_args();
void test_search_usage();

void cli_tests()
{
    test_search_args();
    test_search_usage();

    spdlog::debug("CLI tests passed");
}

void test_search_args()
{
    {
        auto args = parse_search_args({"pink", "floyd"});
        assert(args);
        assert(args->query == "pink floyd");
        assert(args->limit == slsk::client::Client::DEFAULT_SEARCH_LIMIT);
        assert(not args->window);
        assert(not args->json);
    }

    {
        auto args = parse_search_args({"--json", "-n", "5", "-w", "3", "echoes"});
        assert(args);
        assert(args->query == "echoes");
        assert(args->limit == 5);
        assert(args->window == 3s);
        assert(args->json);
    }

    assert(not parse_search_args({}));
    assert(not parse_search_args({"--json"}));
    assert(not parse_search_args({"-n", "many", "echoes"}));
    assert(not parse_search_args({"-w", "-1", "echoes"}));
}

void test_search_usage()
{
    const std::string_view usage = slsk::cli::SEARCH_USAGE;

    // every flag parse_search_args accepts is listed
    for (const auto* flag : {"--json", "-n <limit>", "-w <seconds>"}) {
        assert(usage.find(flag) != std::string_view::npos);
    }
}
