#pragma once

#include "tg/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tg {

/// TDLib-backed Telegram bot client
///
/// Authorises with a bot token and exposes the handful of calls the
/// broadcaster needs. All calls are synchronous and thread-safe; updates are
/// processed on an internal thread and surfaced through callbacks.
/// Failures are reported with exceptions from tg/exceptions.hpp.
class BotClient {
public:
    // Configuration for the client
    struct Config {
        int32_t api_id;
        std::string api_hash;
        std::string bot_token;
        std::string database_directory;
        std::string files_directory;
        std::string logs_directory;  // If set, TDLib logs go here instead of stderr
        int32_t log_verbosity = 1;   // 0=fatal, 1=error, 2=warning, 3=info, 4+=debug
        bool use_test_dc = false;    // Use test data center
        std::chrono::milliseconds query_timeout{10000};
        std::chrono::milliseconds send_timeout{30000};  // Until the server confirms a sent message
    };

    explicit BotClient(const Config& config);
    ~BotClient();

    // Disable copy
    BotClient(const BotClient&) = delete;
    BotClient& operator=(const BotClient&) = delete;

    // Initialisation & lifecycle
    void start();
    void stop();

    /// Block until the bot is authorised
    /// @throws InvalidTokenException if the token was rejected
    /// @throws TimeoutException if authorisation did not finish in time
    void wait_until_ready(std::chrono::seconds timeout = std::chrono::seconds{30});

    AuthState get_auth_state() const;

    // Entity lookup
    User get_me();
    std::optional<Chat> resolve_username(const std::string& username);
    std::optional<Chat> get_chat(int64_t chat_id);

    // Bot profile

    /// Change the bot's own profile; Telegram enforces the text limits
    /// @throws BadRequestException, PermissionDeniedException, RateLimitException, TimeoutException
    void set_name(const std::string& name);
    void set_description(const std::string& description);
    void set_short_description(const std::string& short_description);

    /// Upload a local image file as the profile photo
    void set_profile_photo(const std::string& path);

    // Messaging

    /// Send a text message and wait until Telegram confirms delivery
    /// @throws RateLimitException, InvalidTokenException, BadRequestException,
    ///         PermissionDeniedException, ChatNotFoundException, TimeoutException, TdLibException
    Message send_text(const Recipient& recipient, const std::string& text, ParseMode parse_mode = ParseMode::NONE);

    // Event callbacks
    using MessageCallback = std::function<void(const Message&)>;
    using CallbackQueryCallback = std::function<void(const CallbackQuery&)>;

    /// Set callback for new incoming messages
    /// The callback is called from the TDLib event loop thread
    void set_message_callback(MessageCallback callback);

    /// Set callback for inline keyboard presses
    /// The callback is called from the TDLib event loop thread
    void set_callback_query_callback(CallbackQueryCallback callback);

private:
    class Impl;
    Config config_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tg
