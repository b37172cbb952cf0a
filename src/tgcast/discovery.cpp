#include "tgcast/discovery.hpp"

#include "tg/formatters.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <regex>
#include <string>
#include <system_error>

namespace tgcast {

namespace {

enum class ReferenceKind { ID, HANDLE };

struct ReferencePattern {
    std::regex regex;
    ReferenceKind kind;
};

const std::array<ReferencePattern, 6>& reference_patterns() {
    static const std::array<ReferencePattern, 6> patterns = {{
        {std::regex(R"(Chat: (-?\d+))"), ReferenceKind::ID},
        {std::regex(R"(Chat: [^)]+\(@([^)]+)\))"), ReferenceKind::HANDLE},
        {std::regex(R"(Sender: (\d+))"), ReferenceKind::ID},
        {std::regex(R"(Sender: [^)]+\(@([^)]+)\))"), ReferenceKind::HANDLE},
        {std::regex(R"(CallbackQuery: From=(\d+))"), ReferenceKind::ID},
        {std::regex(R"(CallbackQuery: From=[^)]+\(@([^)]+)\))"), ReferenceKind::HANDLE},
    }};
    return patterns;
}

constexpr std::array<std::string_view, 2> kPayloadMarkers = {"; Content:", ", Data="};

std::string_view reference_section(std::string_view line) {
    auto end = line.size();
    for (auto marker : kPayloadMarkers) {
        auto pos = line.find(marker);
        if (pos != std::string_view::npos && pos < end) {
            end = pos;
        }
    }
    return line.substr(0, end);
}

}  // namespace

std::size_t collect_recipients(std::string_view line, RecipientSet& out) {
    auto section = reference_section(line);
    std::size_t found = 0;

    for (const auto& pattern : reference_patterns()) {
        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_search(section.begin(), section.end(), match, pattern.regex)) {
            continue;
        }

        auto value = match.str(1);
        if (pattern.kind == ReferenceKind::ID) {
            auto recipient = tg::Recipient::parse(value);
            // Out-of-range ids come back as handles; they cannot be addressed
            if (!recipient || !recipient->is_id()) {
                spdlog::debug("Skipping unaddressable id '{}'", value);
                continue;
            }
            out.insert(*recipient);
        } else {
            out.insert(tg::Recipient::from_handle(value));
        }
        ++found;
    }

    return found;
}

DiscoveryResult discover_recipients(std::istream& input) {
    DiscoveryResult result;
    result.log_found = true;

    std::string line;
    while (std::getline(input, line)) {
        ++result.lines_scanned;
        collect_recipients(line, result.recipients);
    }

    return result;
}

DiscoveryResult discover_recipients(const std::filesystem::path& log_path) {
    std::error_code ec;
    if (!std::filesystem::exists(log_path, ec)) {
        spdlog::warn("Interaction log {} not found, no recipients discovered", log_path.string());
        return {};
    }

    std::ifstream file(log_path);
    if (!file) {
        spdlog::error("Cannot open interaction log {}", log_path.string());
        return DiscoveryResult{.log_found = true};
    }

    auto result = discover_recipients(file);
    spdlog::info(
        "Discovered {} unique recipient(s) in {} line(s) of {}",
        result.recipients.size(),
        result.lines_scanned,
        log_path.string()
    );
    return result;
}

}  // namespace tgcast
