#pragma once

#include "tg/types.hpp"
#include "tgcast/constants.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

namespace tgcast {

/// Append-only log of traffic seen by the bot
///
/// Every line is prefixed with the local time ("YYYY-MM-DD HH:MM:SS - ").
/// The file doubles as the input of recipient discovery, so the line
/// formatters below must keep to the grammar discovery understands.
class InteractionLog {
public:
    explicit InteractionLog(std::filesystem::path path);

    // Disable copy
    InteractionLog(const InteractionLog&) = delete;
    InteractionLog& operator=(const InteractionLog&) = delete;

    /// Append one timestamped line, creating parent directories as needed
    /// @return false if the line could not be written (the error is logged)
    bool append(std::string_view line);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] bool exists() const;

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

// Line formatters

std::string format_outgoing(const tg::Recipient& recipient, std::string_view text, std::size_t limit = kLogTextLimit);

std::string format_incoming(const tg::Message& message, std::size_t limit = kLogTextLimit);

std::string format_callback_query(const tg::CallbackQuery& query);

}  // namespace tgcast
