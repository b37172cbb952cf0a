#include "tgcast/td_transport.hpp"

#include "tg/exceptions.hpp"
#include "tg/formatters.hpp"

#include <spdlog/spdlog.h>

namespace tgcast {

TdTransport::TdTransport(tg::BotClient& client) : client_(client) {}

DispatchOutcome TdTransport::deliver(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode) {
    try {
        auto message = client_.send_text(recipient, text, parse_mode);
        spdlog::debug("TdTransport: message {} delivered to chat {}", message.id, message.chat_id);
        return DispatchOutcome::delivered();
    } catch (const tg::TelegramException& e) {
        auto outcome = classify_exception(e);
        if (outcome.is_rate_limited()) {
            spdlog::warn("TdTransport: rate limited while sending to {}: {}", recipient, e.what());
        } else {
            spdlog::warn("TdTransport: failed to send to {}: {}", recipient, e.what());
        }
        return outcome;
    }
}

TdProfileBackend::TdProfileBackend(tg::BotClient& client) : client_(client) {}

void TdProfileBackend::set_name(const std::string& name) { client_.set_name(name); }

void TdProfileBackend::set_description(const std::string& description) { client_.set_description(description); }

void TdProfileBackend::set_short_description(const std::string& short_description) {
    client_.set_short_description(short_description);
}

void TdProfileBackend::set_photo(const std::filesystem::path& photo) { client_.set_profile_photo(photo.string()); }

}  // namespace tgcast
