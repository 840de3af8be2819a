#include "cli_args.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "misc/tools.hpp"

namespace slsk::cli {

auto parse_search_args(const std::vector<std::string>& words)
  -> std::optional<SearchArgs>
{
    using slsk::utils::to_integer;

    SearchArgs args;
    std::vector<std::string> query;

    for (std::size_t i = 0; i < words.size(); ++i) {
        const auto& word = words[i];

        if (word == "--json") {
            args.json = true;
        }
        else if ((word == "-n" or word == "-w") and i + 1 < words.size()) {
            auto value = to_integer<int>(words[++i]);
            if (not value or *value < 0) {
                return std::nullopt;
            }

            if (word == "-n") {
                args.limit = *value;
            }
            else {
                args.window = std::chrono::seconds(*value);
            }
        }
        else {
            query.push_back(word);
        }
    }

    if (query.empty()) {
        return std::nullopt;
    }

    args.query = fmt::format("{}", fmt::join(query, " "));
    return args;
}

}  // namespace slsk::cli
