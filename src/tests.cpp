#include <cstdlib>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tests/tests.hpp"

int main()
{
    auto logger = spdlog::stderr_color_mt("slsk");
    auto internal_logger = spdlog::stderr_color_mt("internal_logger");
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::warn);
    internal_logger->set_level(spdlog::level::err);
    spdlog::cfg::load_env_levels();

    codec_tests();
    format_tests();
    cli_tests();
    connection_tests();
    session_tests();
    search_tests();
    transfer_tests();

    spdlog::info("All tests passed");
    return EXIT_SUCCESS;
}
