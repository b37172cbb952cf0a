#include "tg/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tg {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<int64_t> parse_int64(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// Recipient methods
Recipient::Recipient(std::variant<int64_t, std::string> value) : value_(std::move(value)) {
    if (std::holds_alternative<int64_t>(value_)) {
        canonical_ = std::to_string(std::get<int64_t>(value_));
    } else {
        canonical_ = "@" + std::get<std::string>(value_);
    }
}

std::optional<Recipient> Recipient::parse(std::string_view raw) {
    auto s = trim(raw);
    if (s.empty()) {
        return std::nullopt;
    }

    if (auto id = parse_int64(s)) {
        return from_id(*id);
    }

    if (s.front() == '@') {
        s.remove_prefix(1);
        if (s.empty()) {
            return std::nullopt;
        }
    }
    return from_handle(s);
}

Recipient Recipient::from_id(int64_t id) { return Recipient(std::variant<int64_t, std::string>(id)); }

Recipient Recipient::from_handle(std::string_view handle) {
    if (!handle.empty() && handle.front() == '@') {
        handle.remove_prefix(1);
    }
    return Recipient(std::variant<int64_t, std::string>(std::string(handle)));
}

std::optional<int64_t> Recipient::id() const {
    if (is_id()) {
        return std::get<int64_t>(value_);
    }
    return std::nullopt;
}

std::string_view Recipient::username() const {
    if (is_handle()) {
        return std::get<std::string>(value_);
    }
    return {};
}

// User methods
std::string User::display_name() const {
    if (!first_name.empty() && !last_name.empty()) {
        return first_name + " " + last_name;
    } else if (!first_name.empty()) {
        return first_name;
    } else if (!last_name.empty()) {
        return last_name;
    } else if (!username.empty()) {
        return "@" + username;
    } else {
        return "User " + std::to_string(id);
    }
}

std::string User::get_identifier() const {
    if (!username.empty()) {
        return "@" + username;
    }
    return display_name();
}

// Utility functions
std::string chat_type_to_string(ChatType type) {
    switch (type) {
        case ChatType::PRIVATE:
            return "private";
        case ChatType::GROUP:
            return "group";
        case ChatType::SUPERGROUP:
            return "supergroup";
        case ChatType::CHANNEL:
            return "channel";
        default:
            return "unknown";
    }
}

std::string media_type_to_string(MediaType type) {
    switch (type) {
        case MediaType::PHOTO:
            return "photo";
        case MediaType::VIDEO:
            return "video";
        case MediaType::DOCUMENT:
            return "document";
        case MediaType::AUDIO:
            return "audio";
        case MediaType::VOICE:
            return "voice";
        case MediaType::ANIMATION:
            return "animation";
        case MediaType::STICKER:
            return "sticker";
        case MediaType::VIDEO_NOTE:
            return "video_note";
        default:
            return "unknown";
    }
}

std::string parse_mode_to_string(ParseMode mode) {
    switch (mode) {
        case ParseMode::NONE:
            return "none";
        case ParseMode::HTML:
            return "html";
        case ParseMode::MARKDOWN:
            return "markdown";
        default:
            return "unknown";
    }
}

std::optional<ParseMode> parse_mode_from_string(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "none" || lower == "plain") return ParseMode::NONE;
    if (lower == "html") return ParseMode::HTML;
    if (lower == "markdown" || lower == "markdownv2") return ParseMode::MARKDOWN;

    return std::nullopt;
}

}  // namespace tg
