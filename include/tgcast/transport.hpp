#pragma once

#include "tg/types.hpp"
#include "tgcast/outcome.hpp"

#include <string>
#include <string_view>

namespace tgcast {

/// Abstract delivery port
///
/// Implementations attempt to deliver one message to one recipient and
/// classify the result into exactly one DispatchOutcome. A rate-limit
/// outcome must carry the backoff the server asked for, unmodified.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual DispatchOutcome
    deliver(const tg::Recipient& recipient, const std::string& text, tg::ParseMode parse_mode) = 0;

    /// Short name used in log lines
    [[nodiscard]] virtual std::string_view name() const = 0;
};

}  // namespace tgcast
