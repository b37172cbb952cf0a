#pragma once

#include "tg/types.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <set>
#include <string_view>

namespace tgcast {

/// Deduplicated recipients, iterated in canonical order
using RecipientSet = std::set<tg::Recipient>;

struct DiscoveryResult {
    RecipientSet recipients;
    bool log_found{false};
    std::size_t lines_scanned{0};
};

/// Add every recipient referenced by one interaction-log line to `out`
///
/// Recognises chat, sender and callback-origin references, each by id or by
/// handle. Only the reference part of the line is looked at: anything after
/// "; Content:" or ", Data=" is message payload and is skipped.
/// @return number of references found on the line
std::size_t collect_recipients(std::string_view line, RecipientSet& out);

DiscoveryResult discover_recipients(std::istream& input);

/// Scan a log file; a missing file yields an empty result with log_found == false
DiscoveryResult discover_recipients(const std::filesystem::path& log_path);

}  // namespace tgcast
