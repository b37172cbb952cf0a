#include "tg/exceptions.hpp"

#include <regex>
#include <stdexcept>
#include <string>

namespace tg {

std::optional<std::chrono::seconds> parse_retry_after(std::string_view message) {
    static const std::regex retry_after_pattern(R"((?:retry after |FLOOD_WAIT_)(\d+))", std::regex::icase);

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(message.begin(), message.end(), match, retry_after_pattern)) {
        return std::nullopt;
    }

    try {
        return std::chrono::seconds{std::stoll(match[1].str())};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace tg
