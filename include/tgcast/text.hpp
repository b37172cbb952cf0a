#pragma once

#include "tgcast/constants.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace tgcast {

/// Number of UTF-8 code points in `text`
std::size_t utf8_length(std::string_view text);

/// Longest prefix of `text` holding at most `limit` code points
std::string_view utf8_prefix(std::string_view text, std::size_t limit);

/// Cap `text` at `limit` code points, appending "..." when something was cut
///
/// Only used for log and progress echoes; transports always get the full text.
std::string truncate_for_log(std::string_view text, std::size_t limit = kLogTextLimit);

}  // namespace tgcast
