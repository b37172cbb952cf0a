#pragma once

#include "tg/types.hpp"

#include <ctime>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace tg {

// Helper to format Unix timestamp as YYYY-MM-DD HH:MM:SS in local time
inline std::string format_datetime(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
}

namespace detail {

extern const std::unordered_map<ChatType, std::string_view> chat_type_to_string_map;
extern const std::unordered_map<MediaType, std::string_view> media_type_to_string_map;
extern const std::unordered_map<ParseMode, std::string_view> parse_mode_to_string_map;

}  // namespace detail

}  // namespace tg

// fmt formatters for tg types

template <>
struct fmt::formatter<tg::ChatType> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tg::ChatType type, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", tg::detail::chat_type_to_string_map.at(type));
    }
};

template <>
struct fmt::formatter<tg::MediaType> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tg::MediaType type, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", tg::detail::media_type_to_string_map.at(type));
    }
};

template <>
struct fmt::formatter<tg::ParseMode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tg::ParseMode mode, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", tg::detail::parse_mode_to_string_map.at(mode));
    }
};

template <>
struct fmt::formatter<tg::Recipient> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tg::Recipient& recipient, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(recipient.canonical(), ctx);
    }
};

template <>
struct fmt::formatter<tg::User> : fmt::formatter<std::string_view> {
    enum class Format : char {
        DISPLAY_NAME = 'd',
        USERNAME = 'u',
        IDENTIFIER = 'i',
    };

    Format format_spec{Format::DISPLAY_NAME};

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        if (it != ctx.end() && (*it == 'd' || *it == 'u' || *it == 'i')) {
            format_spec = static_cast<Format>(*it);
            ++it;
        }
        return it;
    }

    template <typename FormatContext>
    auto format(const tg::User& user, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (format_spec) {
            case Format::DISPLAY_NAME:
                if (user.has_name() && !user.username.empty()) {
                    return fmt::format_to(ctx.out(), "{} (@{})", user.display_name(), user.username);
                }
                return fmt::format_to(ctx.out(), "{}", user.display_name());
            case Format::USERNAME:
                if (!user.username.empty()) {
                    return fmt::format_to(ctx.out(), "@{}", user.username);
                }
                // Fallback to user ID
                return fmt::format_to(ctx.out(), "User {}", user.id);
            case Format::IDENTIFIER:
                return fmt::format_to(ctx.out(), "{}", user.id);
        }
        return ctx.out();
    }
};

template <>
struct fmt::formatter<tg::Chat> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tg::Chat& chat, FormatContext& ctx) const -> decltype(ctx.out()) {
        if (!chat.username.empty()) {
            return fmt::format_to(ctx.out(), "{} (@{})", chat.title, chat.username);
        }
        return fmt::format_to(ctx.out(), "{}", chat.title);
    }
};
