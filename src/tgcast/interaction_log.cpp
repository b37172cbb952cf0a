#include "tgcast/interaction_log.hpp"

#include "tg/formatters.hpp"
#include "tgcast/text.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <system_error>

namespace tgcast {

namespace {

// Titles are free text and must not look like reference fields
std::string sanitise_title(std::string_view title) {
    std::string result;
    result.reserve(title.size());
    for (char c : title) {
        switch (c) {
            case '(':
            case ')':
            case ';':
            case ':':
            case '\n':
            case '\r':
                result += ' ';
                break;
            default:
                result += c;
        }
    }
    return result;
}

std::string flatten_text(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return result;
}

std::string handle_suffix(std::string_view username) {
    if (username.empty()) {
        return {};
    }
    return fmt::format(" (@{})", username);
}

}  // namespace

InteractionLog::InteractionLog(std::filesystem::path path) : path_(std::move(path)) {}

bool InteractionLog::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool InteractionLog::append(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create log directory {}: {}", path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(path_, std::ios::app);
    if (!file) {
        spdlog::error("Cannot open interaction log {}", path_.string());
        return false;
    }

    file << tg::format_datetime(static_cast<int64_t>(std::time(nullptr))) << " - " << line << '\n';
    if (!file) {
        spdlog::error("Failed to write to interaction log {}", path_.string());
        return false;
    }
    return true;
}

std::string format_outgoing(const tg::Recipient& recipient, std::string_view text, std::size_t limit) {
    return fmt::format("OUTGOING; Chat: {}; Content: Text: '{}'", recipient, truncate_for_log(flatten_text(text), limit));
}

std::string format_incoming(const tg::Message& message, std::size_t limit) {
    std::string chat_label;
    if (!message.chat_username.empty()) {
        chat_label = "@" + message.chat_username;
    } else if (!message.chat_title.empty()) {
        chat_label = sanitise_title(message.chat_title);
    } else {
        chat_label = "Private";
    }

    auto line = fmt::format("INCOMING; MessageID: {}; Chat: {} ({})", message.id, message.chat_id, chat_label);
    if (message.sender_id != 0) {
        line += fmt::format("; Sender: {}{}", message.sender_id, handle_suffix(message.sender_username));
    }

    if (message.media) {
        line += fmt::format("; Content: {}", *message.media);
        if (!message.text.empty()) {
            line += fmt::format(", Caption: '{}'", truncate_for_log(flatten_text(message.text), limit));
        }
    } else {
        line += fmt::format("; Content: Text: '{}'", truncate_for_log(flatten_text(message.text), limit));
    }
    return line;
}

std::string format_callback_query(const tg::CallbackQuery& query) {
    return fmt::format(
        "INCOMING; CallbackQuery: From={}{}, Data='{}', MsgID={}",
        query.sender_id,
        handle_suffix(query.sender_username),
        flatten_text(query.data),
        query.message_id
    );
}

}  // namespace tgcast
