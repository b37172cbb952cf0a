#include "tgcast/text.hpp"

namespace tgcast {

namespace {

bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

}  // namespace

std::size_t utf8_length(std::string_view text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!is_continuation_byte(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string_view utf8_prefix(std::string_view text, std::size_t limit) {
    std::size_t code_points = 0;
    std::size_t pos = 0;

    for (; pos < text.size(); ++pos) {
        if (is_continuation_byte(static_cast<unsigned char>(text[pos]))) {
            continue;
        }
        if (code_points == limit) {
            break;
        }
        ++code_points;
    }

    return text.substr(0, pos);
}

std::string truncate_for_log(std::string_view text, std::size_t limit) {
    auto prefix = utf8_prefix(text, limit);
    if (prefix.size() == text.size()) {
        return std::string(text);
    }

    std::string result(prefix);
    result += kTruncationMarker;
    return result;
}

}  // namespace tgcast
