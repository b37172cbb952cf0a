#include "tg/client.hpp"
#include "tg/exceptions.hpp"
#include "tg/pending_results.hpp"

#include <td/telegram/Client.h>
#include <td/telegram/td_api.h>
#include <td/telegram/td_api.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace tg {

namespace td_api = td::td_api;
namespace fs = std::filesystem;

// Helper functions to convert TDLib types to our types
namespace {

// Supergroup and channel chat ids are derived from the supergroup id
constexpr int64_t kSupergroupChatIdOffset = -1000000000000LL;

ChatType convert_chat_type(const td_api::ChatType& type) {
    switch (type.get_id()) {
        case td_api::chatTypePrivate::ID:
        case td_api::chatTypeSecret::ID:
            return ChatType::PRIVATE;
        case td_api::chatTypeBasicGroup::ID:
            return ChatType::GROUP;
        case td_api::chatTypeSupergroup::ID: {
            auto& sg = static_cast<const td_api::chatTypeSupergroup&>(type);
            return sg.is_channel_ ? ChatType::CHANNEL : ChatType::SUPERGROUP;
        }
        default:
            return ChatType::PRIVATE;
    }
}

std::string first_active_username(const td_api::object_ptr<td_api::usernames>& usernames) {
    if (usernames && !usernames->active_usernames_.empty()) {
        return usernames->active_usernames_[0];
    }
    return "";
}

User convert_user(const td_api::user& user) {
    User result;
    result.id = user.id_;
    result.username = first_active_username(user.usernames_);
    result.first_name = user.first_name_;
    result.last_name = user.last_name_;
    result.is_bot = user.type_ && user.type_->get_id() == td_api::userTypeBot::ID;
    return result;
}

std::optional<MediaType> convert_message_content_type(const td_api::MessageContent& content) {
    switch (content.get_id()) {
        case td_api::messagePhoto::ID:
            return MediaType::PHOTO;
        case td_api::messageVideo::ID:
            return MediaType::VIDEO;
        case td_api::messageDocument::ID:
            return MediaType::DOCUMENT;
        case td_api::messageAudio::ID:
            return MediaType::AUDIO;
        case td_api::messageVoiceNote::ID:
            return MediaType::VOICE;
        case td_api::messageAnimation::ID:
            return MediaType::ANIMATION;
        case td_api::messageSticker::ID:
            return MediaType::STICKER;
        case td_api::messageVideoNote::ID:
            return MediaType::VIDEO_NOTE;
        default:
            return std::nullopt;
    }
}

std::string extract_message_text(const td_api::MessageContent& content) {
    switch (content.get_id()) {
        case td_api::messageText::ID:
            return static_cast<const td_api::messageText&>(content).text_->text_;
        case td_api::messagePhoto::ID: {
            auto& photo = static_cast<const td_api::messagePhoto&>(content);
            return photo.caption_ ? photo.caption_->text_ : "";
        }
        case td_api::messageVideo::ID: {
            auto& video = static_cast<const td_api::messageVideo&>(content);
            return video.caption_ ? video.caption_->text_ : "";
        }
        case td_api::messageDocument::ID: {
            auto& doc = static_cast<const td_api::messageDocument&>(content);
            return doc.caption_ ? doc.caption_->text_ : "";
        }
        default:
            return "";
    }
}

std::optional<std::chrono::seconds> retry_after_of(const td_api::error& error) {
    return parse_retry_after(error.message_);
}

/// Map a TDLib error onto the tg exception hierarchy
[[noreturn]] void throw_td_error(const td_api::error& error) {
    switch (error.code_) {
        case 429:
            throw RateLimitException(retry_after_of(error).value_or(std::chrono::seconds{0}));
        case 401:
            throw InvalidTokenException(error.message_);
        case 403:
            throw PermissionDeniedException(error.message_);
        case 400:
        case 404:
            throw BadRequestException(error.message_);
        default:
            throw TdLibException(error.code_, error.message_);
    }
}

void throw_if_error(const td_api::object_ptr<td_api::Object>& response) {
    if (!response) {
        throw TdLibException(0, "Empty response");
    }
    if (response->get_id() == td_api::error::ID) {
        throw_td_error(static_cast<const td_api::error&>(*response));
    }
}

void expect_ok(const td_api::object_ptr<td_api::Object>& response, const char* request) {
    if (response->get_id() != td_api::ok::ID) {
        throw OperationException(std::string("Unexpected response to ") + request);
    }
}

}  // namespace

// Implementation class
class BotClient::Impl {
public:
    explicit Impl(const Config& config) : config_(config), client_id_(0), running_(false) {
        spdlog::info("Creating BotClient with database: {}", config.database_directory);
    }

    ~Impl() {
        if (running_) {
            stop();
        }
    }

    void start() {
        if (running_) {
            return;
        }

        // Configure TDLib logging before creating the client
        configure_tdlib_logging();

        running_ = true;
        client_id_ = td::ClientManager::get_manager_singleton()->create_client_id();

        // Start the update handler thread
        update_thread_ = std::thread([this]() { process_updates(); });

        spdlog::info("BotClient started with client_id: {}", client_id_);

        // Send initial configuration
        send_query(
            td_api::make_object<td_api::setTdlibParameters>(
                config_.use_test_dc,
                config_.database_directory,
                config_.files_directory,
                "",     // database_encryption_key
                false,  // use_file_database
                true,   // use_chat_info_database
                false,  // use_message_database
                false,  // use_secret_chats
                config_.api_id,
                config_.api_hash,
                "en",
                "Server",
                "",
                "1.0"
            ),
            [this](td_api::object_ptr<td_api::Object> response) {
                if (response && response->get_id() == td_api::error::ID) {
                    auto& error = static_cast<td_api::error&>(*response);
                    spdlog::error("Failed to set TDLib parameters: {}", error.message_);
                    fail_authorization(error.message_);
                    return;
                }
                spdlog::debug("TDLib parameters set");
            }
        );
    }

    void stop() {
        if (!running_) {
            return;
        }

        spdlog::info("Stopping BotClient");

        send_query(td_api::make_object<td_api::close>(), [](auto) { spdlog::debug("Close request acknowledged"); });

        // The update thread exits when authorizationStateClosed is received
        if (update_thread_.joinable()) {
            auto start = std::chrono::steady_clock::now();
            constexpr auto timeout = std::chrono::seconds(5);

            while (running_ && std::chrono::steady_clock::now() - start < timeout) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            // Force stop if timeout exceeded
            if (running_) {
                spdlog::warn("BotClient shutdown timeout, forcing stop");
                running_ = false;
            }

            update_thread_.join();
        }

        spdlog::info("BotClient stopped");
    }

    // Send a query to TDLib and register a callback
    template <typename QueryType, typename Callback>
    void send_query(td_api::object_ptr<QueryType> query, Callback callback) {
        auto query_id = next_query_id_++;

        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks_[query_id] = [callback](td_api::object_ptr<td_api::Object> response) {
                callback(std::move(response));
            };
        }

        td::ClientManager::get_manager_singleton()->send(client_id_, query_id, std::move(query));
    }

    // Send a query and wait for response synchronously
    template <typename QueryType>
    td_api::object_ptr<td_api::Object> send_query_sync(td_api::object_ptr<QueryType> query) {
        auto result_promise = std::make_shared<std::promise<td_api::object_ptr<td_api::Object>>>();
        auto result_future = result_promise->get_future();

        send_query(std::move(query), [result_promise](td_api::object_ptr<td_api::Object> response) {
            result_promise->set_value(std::move(response));
        });

        if (result_future.wait_for(config_.query_timeout) == std::future_status::timeout) {
            throw TimeoutException("Query timeout");
        }

        auto response = result_future.get();
        throw_if_error(response);
        return response;
    }

    // Process updates from TDLib
    void process_updates() {
        auto* manager = td::ClientManager::get_manager_singleton();

        while (running_) {
            auto response = manager->receive(1.0);  // 1 second timeout

            if (!response.object) {
                continue;
            }

            if (response.request_id == 0) {
                // This is an update, not a response to a query
                process_update(std::move(response.object));
            } else {
                std::function<void(td_api::object_ptr<td_api::Object>)> callback;

                {
                    std::lock_guard<std::mutex> lock(callbacks_mutex_);
                    auto it = callbacks_.find(response.request_id);
                    if (it != callbacks_.end()) {
                        callback = std::move(it->second);
                        callbacks_.erase(it);
                    }
                }

                if (callback) {
                    callback(std::move(response.object));
                }
            }
        }
    }

    // Process an update from TDLib
    void process_update(td_api::object_ptr<td_api::Object> update) {
        if (!update) {
            return;
        }

        switch (update->get_id()) {
            case td_api::updateAuthorizationState::ID: {
                auto auth_update = td::move_tl_object_as<td_api::updateAuthorizationState>(update);
                process_authorization_state(std::move(auth_update->authorization_state_));
                break;
            }

            case td_api::updateNewChat::ID: {
                auto chat_update = td::move_tl_object_as<td_api::updateNewChat>(update);
                auto chat = convert_chat(*chat_update->chat_);
                spdlog::debug("updateNewChat: id={} type={} title='{}'", chat.id, static_cast<int>(chat.type), chat.title);
                std::lock_guard<std::mutex> lock(cache_mutex_);
                chats_[chat.id] = std::move(chat);
                break;
            }

            case td_api::updateUser::ID: {
                auto user_update = td::move_tl_object_as<td_api::updateUser>(update);
                auto user = convert_user(*user_update->user_);
                spdlog::debug("updateUser: id={} @{} '{}'", user.id, user.username, user.display_name());
                std::lock_guard<std::mutex> lock(cache_mutex_);
                users_[user.id] = std::move(user);
                break;
            }

            case td_api::updateSupergroup::ID: {
                auto sg_update = td::move_tl_object_as<td_api::updateSupergroup>(update);
                auto chat_id = kSupergroupChatIdOffset - sg_update->supergroup_->id_;
                std::lock_guard<std::mutex> lock(cache_mutex_);
                supergroup_usernames_[chat_id] = first_active_username(sg_update->supergroup_->usernames_);
                break;
            }

            case td_api::updateNewMessage::ID: {
                auto message_update = td::move_tl_object_as<td_api::updateNewMessage>(update);
                auto message = convert_message(*message_update->message_);
                spdlog::debug("updateNewMessage: id={} chat={}", message.id, message.chat_id);

                if (message.is_outgoing) {
                    break;
                }

                std::lock_guard<std::mutex> lock(message_callback_mutex_);
                if (message_callback_) {
                    message_callback_(message);
                }
                break;
            }

            case td_api::updateNewCallbackQuery::ID: {
                auto query_update = td::move_tl_object_as<td_api::updateNewCallbackQuery>(update);
                auto query = convert_callback_query(*query_update);
                spdlog::debug("updateNewCallbackQuery: id={} from={}", query.id, query.sender_id);

                std::lock_guard<std::mutex> lock(message_callback_mutex_);
                if (callback_query_callback_) {
                    callback_query_callback_(query);
                }
                break;
            }

            case td_api::updateMessageSendSucceeded::ID: {
                auto sent = td::move_tl_object_as<td_api::updateMessageSendSucceeded>(update);
                SendResult result;
                result.message = convert_message(*sent->message_);
                complete_send(sent->old_message_id_, std::move(result));
                break;
            }

            case td_api::updateMessageSendFailed::ID: {
                auto failed = td::move_tl_object_as<td_api::updateMessageSendFailed>(update);
                SendResult result;
                if (failed->error_) {
                    result.error_code = failed->error_->code_;
                    result.error_message = failed->error_->message_;
                } else {
                    result.error_code = 500;
                    result.error_message = "Message sending failed";
                }
                complete_send(failed->old_message_id_, std::move(result));
                break;
            }

            default:
                spdlog::trace("Unhandled update: {}", update->get_id());
                break;
        }
    }

    // Process authorization state updates
    void process_authorization_state(td_api::object_ptr<td_api::AuthorizationState> state) {
        if (!state) {
            return;
        }

        switch (state->get_id()) {
            case td_api::authorizationStateWaitTdlibParameters::ID:
                spdlog::info("Authorization: waiting for TDLib parameters");
                set_auth_state(AuthState::WAIT_PARAMETERS);
                break;

            case td_api::authorizationStateWaitPhoneNumber::ID:
                spdlog::info("Authorization: sending bot token");
                set_auth_state(AuthState::WAIT_TOKEN);
                send_bot_token();
                break;

            case td_api::authorizationStateReady::ID:
                spdlog::info("Authorization: ready");
                set_auth_state(AuthState::READY);
                break;

            case td_api::authorizationStateLoggingOut::ID:
                spdlog::info("Authorization: logging out");
                set_auth_state(AuthState::CLOSED);
                break;

            case td_api::authorizationStateClosing::ID:
                spdlog::info("Authorization: closing");
                set_auth_state(AuthState::CLOSED);
                break;

            case td_api::authorizationStateClosed::ID:
                spdlog::info("Authorization: closed");
                set_auth_state(AuthState::CLOSED);
                running_ = false;
                break;

            default:
                spdlog::debug("Unhandled authorization state: {}", state->get_id());
                break;
        }
    }

    AuthState get_auth_state() const { return auth_state_; }

    void wait_until_ready(std::chrono::seconds timeout) {
        std::unique_lock<std::mutex> lock(auth_mutex_);

        bool done = auth_cv_.wait_for(lock, timeout, [this]() {
            return auth_state_ == AuthState::READY || auth_state_ == AuthState::CLOSED || !auth_error_.empty();
        });

        if (!auth_error_.empty()) {
            throw InvalidTokenException(auth_error_);
        }
        if (!done) {
            throw TimeoutException("Waiting for bot authorisation");
        }
        if (auth_state_ == AuthState::CLOSED) {
            throw InvalidTokenException("session closed during authorisation");
        }
    }

    User get_me_sync() {
        auto response = send_query_sync(td_api::make_object<td_api::getMe>());

        if (response->get_id() != td_api::user::ID) {
            throw TelegramException("Failed to get current user");
        }

        auto user_obj = td::move_tl_object_as<td_api::user>(response);
        return convert_user(*user_obj);
    }

    // Search for a public chat by username
    std::optional<Chat> search_public_chat_sync(const std::string& username) {
        td_api::object_ptr<td_api::Object> response;
        try {
            response = send_query_sync(td_api::make_object<td_api::searchPublicChat>(username));
        } catch (const BadRequestException& e) {
            spdlog::debug("searchPublicChat @{} failed: {}", username, e.what());
            return std::nullopt;
        }

        if (response->get_id() == td_api::chat::ID) {
            auto chat_obj = td::move_tl_object_as<td_api::chat>(response);
            auto chat = convert_chat(*chat_obj);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            chats_[chat.id] = chat;
            return chat;
        }

        return std::nullopt;
    }

    // Get chat by ID
    std::optional<Chat> get_chat_sync(int64_t chat_id) {
        td_api::object_ptr<td_api::Object> response;
        try {
            response = send_query_sync(td_api::make_object<td_api::getChat>(chat_id));
        } catch (const BadRequestException& e) {
            spdlog::debug("getChat {} failed: {}", chat_id, e.what());
            return std::nullopt;
        }

        if (response->get_id() == td_api::chat::ID) {
            auto chat_obj = td::move_tl_object_as<td_api::chat>(response);
            auto chat = convert_chat(*chat_obj);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            chats_[chat.id] = chat;
            return chat;
        }

        return std::nullopt;
    }

    // Send text message and wait for the server-side result
    Message send_text_message_sync(const Recipient& recipient, const std::string& text, ParseMode parse_mode) {
        ensure_ready();

        int64_t chat_id = resolve_chat_id(recipient);

        auto input_content = td_api::make_object<td_api::inputMessageText>(
            make_formatted_text(text, parse_mode), nullptr, true
        );

        auto response = send_query_sync(
            td_api::make_object<td_api::sendMessage>(
                chat_id, nullptr, nullptr, nullptr, nullptr, std::move(input_content)
            )
        );

        if (response->get_id() != td_api::message::ID) {
            throw OperationException("Failed to send message");
        }

        auto pending = td::move_tl_object_as<td_api::message>(response);
        auto result = wait_for_send_result(pending->id_);

        if (!result.message) {
            td_api::error error(result.error_code, result.error_message);
            throw_td_error(error);
        }

        return *result.message;
    }

    // Profile of the bot itself; bots may only edit their own
    void set_name_sync(const std::string& name) {
        ensure_ready();
        expect_ok(send_query_sync(td_api::make_object<td_api::setBotName>(own_user_id(), "", name)), "setBotName");
    }

    void set_description_sync(const std::string& description) {
        ensure_ready();
        expect_ok(
            send_query_sync(td_api::make_object<td_api::setBotInfoDescription>(own_user_id(), "", description)),
            "setBotInfoDescription"
        );
    }

    void set_short_description_sync(const std::string& short_description) {
        ensure_ready();
        expect_ok(
            send_query_sync(
                td_api::make_object<td_api::setBotInfoShortDescription>(own_user_id(), "", short_description)
            ),
            "setBotInfoShortDescription"
        );
    }

    void set_profile_photo_sync(const std::string& path) {
        ensure_ready();
        auto photo = td_api::make_object<td_api::inputChatPhotoStatic>(td_api::make_object<td_api::inputFileLocal>(path));
        expect_ok(
            send_query_sync(td_api::make_object<td_api::setBotProfilePhoto>(own_user_id(), std::move(photo))),
            "setBotProfilePhoto"
        );
    }

    void set_message_callback(MessageCallback callback) {
        std::lock_guard<std::mutex> lock(message_callback_mutex_);
        message_callback_ = std::move(callback);
    }

    void set_callback_query_callback(CallbackQueryCallback callback) {
        std::lock_guard<std::mutex> lock(message_callback_mutex_);
        callback_query_callback_ = std::move(callback);
    }

private:
    struct SendResult {
        std::optional<Message> message;
        int32_t error_code{0};
        std::string error_message;
    };

    void configure_tdlib_logging() {
        // Set log verbosity level
        td::ClientManager::execute(td_api::make_object<td_api::setLogVerbosityLevel>(config_.log_verbosity));

        // Configure log stream
        if (!config_.logs_directory.empty()) {
            fs::create_directories(config_.logs_directory);
            auto log_path = (fs::path(config_.logs_directory) / "tdlib.log").string();

            auto result = td::ClientManager::execute(
                td_api::make_object<td_api::setLogStream>(td_api::make_object<td_api::logStreamFile>(
                    log_path,
                    50 * 1024 * 1024,  // 50 MB max file size
                    false              // Don't redirect stderr
                ))
            );

            if (result->get_id() == td_api::ok::ID) {
                spdlog::info("TDLib logs redirected to: {}", log_path);
            } else if (result->get_id() == td_api::error::ID) {
                auto& error = static_cast<td_api::error&>(*result);
                spdlog::warn("Failed to redirect TDLib logs: {}", error.message_);
            }
        }
    }

    int64_t own_user_id() {
        if (auto id = own_user_id_.load(); id != 0) {
            return id;
        }
        auto me = get_me_sync();
        own_user_id_.store(me.id);
        return me.id;
    }

    void set_auth_state(AuthState state) {
        {
            std::lock_guard<std::mutex> lock(auth_mutex_);
            auth_state_ = state;
        }
        auth_cv_.notify_all();
    }

    void fail_authorization(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(auth_mutex_);
            auth_error_ = reason;
        }
        auth_cv_.notify_all();
    }

    void send_bot_token() {
        send_query(
            td_api::make_object<td_api::checkAuthenticationBotToken>(config_.bot_token),
            [this](td_api::object_ptr<td_api::Object> response) {
                if (response && response->get_id() == td_api::error::ID) {
                    auto& error = static_cast<td_api::error&>(*response);
                    spdlog::error("Bot token rejected: [{}] {}", error.code_, error.message_);
                    fail_authorization(error.message_);
                    return;
                }
                spdlog::debug("Bot token accepted");
            }
        );
    }

    // Mid-session loss of authorisation is reported as an invalid token
    void ensure_ready() const {
        switch (auth_state_.load()) {
            case AuthState::READY:
                return;
            case AuthState::CLOSED:
                throw InvalidTokenException("bot session is no longer authorised");
            default:
                throw AuthenticationException("Bot is not authorised yet");
        }
    }

    int64_t resolve_chat_id(const Recipient& recipient) {
        if (auto id = recipient.id()) {
            // TDLib must know the chat before it can send to it
            if (!get_chat_sync(*id)) {
                throw ChatNotFoundException(*id);
            }
            return *id;
        }

        auto username = std::string(recipient.username());
        auto chat = search_public_chat_sync(username);
        if (!chat) {
            throw ChatNotFoundException(recipient.canonical());
        }
        return chat->id;
    }

    td_api::object_ptr<td_api::formattedText> make_formatted_text(const std::string& text, ParseMode parse_mode) {
        td_api::object_ptr<td_api::TextParseMode> mode;
        switch (parse_mode) {
            case ParseMode::NONE:
                return td_api::make_object<td_api::formattedText>(
                    text, std::vector<td_api::object_ptr<td_api::textEntity>>()
                );
            case ParseMode::HTML:
                mode = td_api::make_object<td_api::textParseModeHTML>();
                break;
            case ParseMode::MARKDOWN:
                mode = td_api::make_object<td_api::textParseModeMarkdown>(2);
                break;
        }

        auto result = td::ClientManager::execute(td_api::make_object<td_api::parseTextEntities>(text, std::move(mode)));
        if (result->get_id() == td_api::error::ID) {
            auto& error = static_cast<td_api::error&>(*result);
            throw BadRequestException("can't parse entities: " + error.message_);
        }
        return td::move_tl_object_as<td_api::formattedText>(result);
    }

    void complete_send(int64_t old_message_id, SendResult result) {
        if (!send_results_.complete(old_message_id, std::move(result))) {
            spdlog::debug("Dropping late send result for message {}", old_message_id);
        }
    }

    SendResult wait_for_send_result(int64_t pending_message_id) {
        auto result = send_results_.wait(pending_message_id, config_.send_timeout);
        if (!result) {
            throw TimeoutException("Waiting for message delivery confirmation");
        }
        return std::move(*result);
    }

    Chat convert_chat(const td_api::chat& chat) {
        Chat result;
        result.id = chat.id_;
        result.title = chat.title_;
        result.type = convert_chat_type(*chat.type_);

        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (chat.type_->get_id() == td_api::chatTypePrivate::ID) {
            auto& priv = static_cast<const td_api::chatTypePrivate&>(*chat.type_);
            auto it = users_.find(priv.user_id_);
            if (it != users_.end()) {
                result.username = it->second.username;
            }
        } else {
            auto it = supergroup_usernames_.find(chat.id_);
            if (it != supergroup_usernames_.end()) {
                result.username = it->second;
            }
        }

        return result;
    }

    Message convert_message(const td_api::message& msg) {
        Message result;
        result.id = msg.id_;
        result.chat_id = msg.chat_id_;
        result.timestamp = msg.date_;
        result.is_outgoing = msg.is_outgoing_;

        if (msg.sender_id_ && msg.sender_id_->get_id() == td_api::messageSenderUser::ID) {
            result.sender_id = static_cast<const td_api::messageSenderUser&>(*msg.sender_id_).user_id_;
        } else if (msg.sender_id_ && msg.sender_id_->get_id() == td_api::messageSenderChat::ID) {
            result.sender_id = static_cast<const td_api::messageSenderChat&>(*msg.sender_id_).chat_id_;
        }

        if (msg.content_) {
            result.text = extract_message_text(*msg.content_);
            result.media = convert_message_content_type(*msg.content_);
        }

        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (auto it = chats_.find(result.chat_id); it != chats_.end()) {
            result.chat_title = it->second.title;
            result.chat_username = it->second.username;
        }
        if (auto it = users_.find(result.sender_id); it != users_.end()) {
            result.sender_username = it->second.username;
        }

        return result;
    }

    CallbackQuery convert_callback_query(const td_api::updateNewCallbackQuery& update) {
        CallbackQuery result;
        result.id = update.id_;
        result.sender_id = update.sender_user_id_;
        result.chat_id = update.chat_id_;
        result.message_id = update.message_id_;

        if (update.payload_ && update.payload_->get_id() == td_api::callbackQueryPayloadData::ID) {
            result.data = static_cast<const td_api::callbackQueryPayloadData&>(*update.payload_).data_;
        }

        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (auto it = users_.find(result.sender_id); it != users_.end()) {
            result.sender_username = it->second.username;
        }

        return result;
    }

    Config config_;
    std::int32_t client_id_;
    std::atomic<bool> running_;
    std::atomic<AuthState> auth_state_{AuthState::WAIT_PARAMETERS};

    // Thread for processing updates
    std::thread update_thread_;

    // Callback management
    std::mutex callbacks_mutex_;
    std::map<std::uint64_t, std::function<void(td_api::object_ptr<td_api::Object>)>> callbacks_;
    std::atomic<std::uint64_t> next_query_id_{1};

    // Authorization synchronisation
    mutable std::mutex auth_mutex_;
    std::condition_variable auth_cv_;
    std::string auth_error_;

    // Results of sent messages keyed by their temporary id
    PendingResults<SendResult> send_results_;
    std::atomic<int64_t> own_user_id_{0};

    // Entity names seen through updates
    std::mutex cache_mutex_;
    std::map<int64_t, User> users_;
    std::map<int64_t, Chat> chats_;
    std::map<int64_t, std::string> supergroup_usernames_;

    // Event callbacks
    std::mutex message_callback_mutex_;
    MessageCallback message_callback_;
    CallbackQueryCallback callback_query_callback_;
};

// BotClient implementation
BotClient::BotClient(const Config& config) : config_(config), impl_(std::make_unique<Impl>(config)) {}

BotClient::~BotClient() = default;

void BotClient::start() { impl_->start(); }

void BotClient::stop() { impl_->stop(); }

void BotClient::wait_until_ready(std::chrono::seconds timeout) { impl_->wait_until_ready(timeout); }

AuthState BotClient::get_auth_state() const { return impl_->get_auth_state(); }

User BotClient::get_me() { return impl_->get_me_sync(); }

std::optional<Chat> BotClient::resolve_username(const std::string& username) {
    // Remove @ prefix if present
    std::string clean_username = username;
    if (!clean_username.empty() && clean_username[0] == '@') {
        clean_username = clean_username.substr(1);
    }

    return impl_->search_public_chat_sync(clean_username);
}

std::optional<Chat> BotClient::get_chat(int64_t chat_id) { return impl_->get_chat_sync(chat_id); }

Message BotClient::send_text(const Recipient& recipient, const std::string& text, ParseMode parse_mode) {
    return impl_->send_text_message_sync(recipient, text, parse_mode);
}

void BotClient::set_name(const std::string& name) { impl_->set_name_sync(name); }

void BotClient::set_description(const std::string& description) { impl_->set_description_sync(description); }

void BotClient::set_short_description(const std::string& short_description) {
    impl_->set_short_description_sync(short_description);
}

void BotClient::set_profile_photo(const std::string& path) { impl_->set_profile_photo_sync(path); }

void BotClient::set_message_callback(MessageCallback callback) { impl_->set_message_callback(std::move(callback)); }

void BotClient::set_callback_query_callback(CallbackQueryCallback callback) {
    impl_->set_callback_query_callback(std::move(callback));
}

}  // namespace tg
