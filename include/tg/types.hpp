#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tg {

// Enumerations
enum class ChatType {
    PRIVATE,     // Direct message with a user
    GROUP,       // Basic group
    SUPERGROUP,  // Supergroup
    CHANNEL      // Channel (broadcast)
};

enum class MediaType { PHOTO, VIDEO, DOCUMENT, AUDIO, VOICE, ANIMATION, STICKER, VIDEO_NOTE };

/// Entity parsing applied to outgoing text
enum class ParseMode {
    NONE,     // Plain text
    HTML,     // Telegram HTML subset
    MARKDOWN  // Telegram MarkdownV2
};

enum class AuthState {
    WAIT_PARAMETERS,  // TDLib not configured yet
    WAIT_TOKEN,       // Waiting for bot token
    READY,            // Authorised and ready
    CLOSED            // Logged out, closing or closed
};

/// Delivery target: a numeric chat id or a public @handle
///
/// Two recipients are equal iff their canonical forms are equal.
/// Canonical form is the decimal id ("-100123") or the handle with a
/// leading '@' ("@alice").
class Recipient {
public:
    /// Parse user input
    /// @return nullopt for empty input, numeric id if the whole string is an integer, handle otherwise
    static std::optional<Recipient> parse(std::string_view raw);

    static Recipient from_id(int64_t id);
    static Recipient from_handle(std::string_view handle);

    [[nodiscard]] bool is_id() const { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_handle() const { return !is_id(); }

    [[nodiscard]] std::optional<int64_t> id() const;

    /// Handle without the leading '@', empty for numeric recipients
    [[nodiscard]] std::string_view username() const;

    [[nodiscard]] const std::string& canonical() const { return canonical_; }

    bool operator==(const Recipient& other) const { return canonical_ == other.canonical_; }
    std::strong_ordering operator<=>(const Recipient& other) const { return canonical_ <=> other.canonical_; }

private:
    explicit Recipient(std::variant<int64_t, std::string> value);

    std::variant<int64_t, std::string> value_;
    std::string canonical_;
};

// Data structures
struct User {
    int64_t id{0};
    std::string username;  // Without @ prefix
    std::string first_name;
    std::string last_name;
    bool is_bot{false};

    // Helper to check if user has a display name
    bool has_name() const { return !first_name.empty() || !last_name.empty(); }

    // Helper to get display name
    std::string display_name() const;

    // Helper to get @username or fallback to name
    std::string get_identifier() const;
};

struct Chat {
    int64_t id{0};
    ChatType type{ChatType::PRIVATE};
    std::string title;
    std::string username;  // Without @ prefix, empty for private groups

    // Helper to check if this is a private chat
    bool is_private() const { return type == ChatType::PRIVATE; }

    // Helper to check if this is a group or supergroup
    bool is_group() const { return type == ChatType::GROUP || type == ChatType::SUPERGROUP; }

    // Helper to check if this is a channel
    bool is_channel() const { return type == ChatType::CHANNEL; }
};

/// Message as seen by the bot, enriched with chat and sender names
struct Message {
    int64_t id{0};
    int64_t chat_id{0};
    std::string chat_title;
    std::string chat_username;
    int64_t sender_id{0};  // 0 for anonymous channel posts
    std::string sender_username;
    int64_t timestamp{0};  // Unix timestamp
    std::string text;
    std::optional<MediaType> media;
    bool is_outgoing{false};

    bool has_media() const { return media.has_value(); }
};

/// Inline keyboard button press
struct CallbackQuery {
    int64_t id{0};
    int64_t sender_id{0};
    std::string sender_username;
    int64_t chat_id{0};
    int64_t message_id{0};
    std::string data;
};

// Utility functions
std::string chat_type_to_string(ChatType type);
std::string media_type_to_string(MediaType type);
std::string parse_mode_to_string(ParseMode mode);
std::optional<ParseMode> parse_mode_from_string(std::string_view name);

}  // namespace tg
