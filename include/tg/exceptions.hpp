#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace tg {

// Base exception for all Telegram-related errors
class TelegramException : public std::exception {
public:
    explicit TelegramException(const std::string& message) : message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }

    const std::string& message() const { return message_; }

private:
    std::string message_;
};

// Authentication-related exceptions
class AuthenticationException : public TelegramException {
public:
    explicit AuthenticationException(const std::string& message) : TelegramException(message) {}
};

class InvalidTokenException : public AuthenticationException {
public:
    explicit InvalidTokenException(const std::string& detail = "")
        : AuthenticationException("Bot token is invalid" + (detail.empty() ? "" : ": " + detail)) {}
};

// Network-related exceptions
class NetworkException : public TelegramException {
public:
    explicit NetworkException(const std::string& message) : TelegramException(message) {}
};

class ConnectionException : public NetworkException {
public:
    ConnectionException() : NetworkException("Failed to connect to Telegram servers") {}
};

class TimeoutException : public NetworkException {
public:
    explicit TimeoutException(const std::string& operation = "")
        : NetworkException("Operation timed out" + (operation.empty() ? "" : ": " + operation)) {}
};

// Entity-related exceptions
class EntityException : public TelegramException {
public:
    explicit EntityException(const std::string& message) : TelegramException(message) {}
};

class ChatNotFoundException : public EntityException {
public:
    explicit ChatNotFoundException(int64_t chat_id) : EntityException("Chat not found: " + std::to_string(chat_id)) {}

    explicit ChatNotFoundException(const std::string& username) : EntityException("Chat not found: " + username) {}
};

class UserNotFoundException : public EntityException {
public:
    explicit UserNotFoundException(int64_t user_id) : EntityException("User not found: " + std::to_string(user_id)) {}
};

// Operation-related exceptions
class OperationException : public TelegramException {
public:
    explicit OperationException(const std::string& message) : TelegramException(message) {}
};

class BadRequestException : public OperationException {
public:
    explicit BadRequestException(const std::string& detail) : OperationException("Bad request: " + detail) {}
};

class PermissionDeniedException : public OperationException {
public:
    explicit PermissionDeniedException(const std::string& operation)
        : OperationException("Permission denied: " + operation) {}
};

class RateLimitException : public OperationException {
public:
    explicit RateLimitException(std::chrono::seconds retry_after = std::chrono::seconds{0})
        : OperationException(
              "Rate limit exceeded" +
              (retry_after.count() > 0 ? ", retry after " + std::to_string(retry_after.count()) + " seconds" : "")
          ),
          retry_after_(retry_after) {}

    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    std::chrono::seconds retry_after_;
};

// TDLib-specific exceptions
class TdLibException : public TelegramException {
public:
    TdLibException(int code, const std::string& message)
        : TelegramException("TDLib error [" + std::to_string(code) + "]: " + message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/// Extract the server-suggested backoff from an error text
/// Understands both "Too Many Requests: retry after 7" and "FLOOD_WAIT_7"
std::optional<std::chrono::seconds> parse_retry_after(std::string_view message);

}  // namespace tg
