#pragma once

#include "tg/client.hpp"
#include "tgcast/profile.hpp"
#include "tgcast/transport.hpp"

namespace tgcast {

/// Transport backed by a TDLib bot client
///
/// The client must be started and authorised by the caller; this class only
/// sends and classifies.
class TdTransport : public Transport {
public:
    explicit TdTransport(tg::BotClient& client);

    [[nodiscard]] DispatchOutcome
    deliver(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode) override;

    [[nodiscard]] std::string_view name() const override { return "tdlib"; }

private:
    tg::BotClient& client_;
};

/// Profile edits for the bot the client is authorised as
class TdProfileBackend : public ProfileBackend {
public:
    explicit TdProfileBackend(tg::BotClient& client);

    void set_name(const std::string& name) override;
    void set_description(const std::string& description) override;
    void set_short_description(const std::string& short_description) override;
    void set_photo(const std::filesystem::path& photo) override;

private:
    tg::BotClient& client_;
};

}  // namespace tgcast
