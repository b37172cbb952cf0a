#pragma once

#include "config.hpp"

#include "tg/client.hpp"

#include <memory>

namespace tgcast::ctl {

/// Build the TDLib client config from our config, creating its directories
tg::BotClient::Config make_client_config(const Config& config);

/// Start a client and wait until the bot token is accepted
/// @throws tg::InvalidTokenException, tg::TimeoutException
std::unique_ptr<tg::BotClient> open_bot(const Config& config);

/// Execute info command - show the bot's own account
int exec_info();

/// Execute collect command - log incoming traffic for `seconds`
int exec_collect(int seconds);

}  // namespace tgcast::ctl
