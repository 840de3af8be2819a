#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <indicators/progress_bar.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cli_args.hpp"
#include "client/client.hpp"
#include "client/errors.hpp"
#include "client/format.hpp"

using slsk::cli::SearchArgs;
using slsk::client::Client;
using slsk::client::Config;


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

auto search_command(Client& client, const SearchArgs& args) -> ExitCode;
auto download_command(
  Client& client, const std::string& username, const std::string& filename
) -> ExitCode;
auto status_command(const Client& client) -> ExitCode;
auto shell_command(Client& client) -> ExitCode;


int main(int argc, char* argv[])
{
    auto logger = spdlog::stderr_color_mt("slsk");
    auto internal_logger = spdlog::stderr_color_mt("internal_logger");
    spdlog::set_default_logger(logger);

#ifdef NDEBUG
    spdlog::set_level(spdlog::level::warn);
    internal_logger->set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::info);
    internal_logger->set_level(spdlog::level::warn);
#endif

    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} {}", argv[0], slsk::cli::SEARCH_USAGE);
        spdlog::error("  {} {}", argv[0], slsk::cli::DOWNLOAD_USAGE);
        spdlog::error("  {} status", argv[0]);
        spdlog::error("  {} shell", argv[0]);
        // clang-format on
        return ExitCode::Fail;
    }

    std::string command = argv[1];
    std::vector<std::string> words(argv + 2, argv + argc);

    try {
        Client client(Config::from_env());

        if (command == "search") {
            auto args = slsk::cli::parse_search_args(words);
            EXPECTED(args, "Usage: {} {}", argv[0], slsk::cli::SEARCH_USAGE);
            return search_command(client, *args);
        }

        if (command == "download") {
            EXPECTED(
              argc == 4, "Usage: {} {}", argv[0], slsk::cli::DOWNLOAD_USAGE
            );
            return download_command(client, argv[2], argv[3]);
        }

        if (command == "status") {
            EXPECTED(argc == 2, "Usage: {} status", argv[0]);
            return status_command(client);
        }

        if (command == "shell") {
            EXPECTED(argc == 2, "Usage: {} shell", argv[0]);
            return shell_command(client);
        }
    } catch (const slsk::Error& e) {
        spdlog::error("{}: {}", e.kind_name(), e.what());
        return ExitCode::Fail;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto search_command(Client& client, const SearchArgs& args) -> ExitCode
{
    auto results = client.search(args.query, args.limit, args.window);

    if (args.json) {
        fmt::println("{}", slsk::client::to_json(results).dump(2));
        return ExitCode::Success;
    }

    if (results.empty()) {
        fmt::println(R"(No results found for "{}".)", args.query);
        return ExitCode::Success;
    }

    fmt::println(R"(Found {} result(s) for "{}":)", results.size(), args.query);

    for (std::size_t i = 0; i < results.size(); ++i) {
        fmt::println("\n{}", slsk::client::format_result(results[i], i));
    }

    return ExitCode::Success;
}


auto progress_bar() -> std::shared_ptr<indicators::ProgressBar>
{
    using namespace indicators;

    return std::make_shared<ProgressBar>(
      option::BarWidth{50}, option::Start{"["}, option::Fill{"■"},
      option::Lead{"■"}, option::Remainder{"-"}, option::End{" ]"},
      option::PostfixText{"..."}, option::ForegroundColor{Color::grey},
      option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
      option::ShowElapsedTime{true}, option::Stream{std::cerr}
    );
}


auto download_command(
  Client& client, const std::string& username, const std::string& filename
) -> ExitCode
{
    using slsk::client::format_size;

    auto bar = progress_bar();

    auto result = client.download(
      username, filename,
      [bar](uint64_t received, uint64_t total) {
          if (total == 0) {
              return;
          }

          const auto msg = fmt::format(
            "{}/{}", format_size(received), format_size(total)
          );
          bar->set_option(indicators::option::PostfixText{msg});
          bar->set_progress(std::size_t((double(received) / total) * 100.0));
      }
    );

    if (not bar->is_completed()) {
        bar->mark_as_completed();
    }

    fmt::println(
      "Download complete!\n\nFile: {}\nSize: {}\nSaved to: {}", result.filename,
      format_size(result.byte_count), result.saved_path.string()
    );

    return ExitCode::Success;
}


auto status_command(const Client& client) -> ExitCode
{
    auto status = client.status();

    if (status.connected) {
        fmt::println("Connected to Soulseek as: {}", status.username.value_or(""));
    }
    else {
        fmt::println(
          "Not connected to Soulseek. Will connect automatically on first "
          "search or download."
        );
    }

    return ExitCode::Success;
}


auto shell_command(Client& client) -> ExitCode
{
    std::string line;

    while (std::getline(std::cin, line)) {
        std::istringstream input(line);
        std::string command;
        input >> command;

        if (command.empty()) {
            continue;
        }

        if (command == "quit" or command == "exit") {
            break;
        }

        try {
            if (command == "status") {
                status_command(client);
            }
            else if (command == "search") {
                std::vector<std::string> words;
                for (std::string word; input >> word;) {
                    words.push_back(word);
                }

                if (auto args = slsk::cli::parse_search_args(words)) {
                    search_command(client, *args);
                }
                else {
                    spdlog::error("Usage: {}", slsk::cli::SEARCH_USAGE);
                }
            }
            else if (command == "download") {
                std::string username;
                std::string filename;
                input >> username;
                std::getline(input >> std::ws, filename);

                if (username.empty() or filename.empty()) {
                    spdlog::error("Usage: {}", slsk::cli::DOWNLOAD_USAGE);
                }
                else {
                    download_command(client, username, filename);
                }
            }
            else if (command == "disconnect") {
                client.disconnect();
            }
            else {
                spdlog::error(R"(Unknown command: "{0}")", command);
            }
        } catch (const slsk::Error& e) {
            spdlog::error("{}: {}", e.kind_name(), e.what());
        }
    }

    return ExitCode::Success;
}
