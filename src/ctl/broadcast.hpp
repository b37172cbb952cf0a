#pragma once

#include <string>

namespace tgcast::ctl {

/// Execute send command - one message to one recipient
int exec_send(const std::string& recipient, const std::string& text, const std::string& parse_mode, bool mock);

/// Execute spam command - `count` copies to one recipient
int exec_spam(const std::string& recipient, const std::string& text, int count, double delay, bool mock);

/// Execute broadcast command - cycle over every recipient in the interaction log
int exec_broadcast(const std::string& text, double delay, double minutes, bool mock);

/// Execute discover command - list recipients found in the interaction log
int exec_discover();

}  // namespace tgcast::ctl
