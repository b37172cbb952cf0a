#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace tgcast {

// Message text echoed into logs and progress lines is capped at this many code points
inline constexpr std::size_t kLogTextLimit = 150;
inline constexpr std::string_view kTruncationMarker = "...";

// Granularity of deadline checks while waiting in a cyclic broadcast
inline constexpr std::chrono::milliseconds kDeadlinePollInterval{100};

// A sweep shorter than this is padded so tiny recipient sets do not spin
inline constexpr std::chrono::seconds kMinSweepDuration{1};

// Telegram limits for the bot profile texts, in code points
inline constexpr std::size_t kMaxBotDescriptionLength = 512;
inline constexpr std::size_t kMaxBotShortDescriptionLength = 120;

// Received-data log inside the data directory
inline constexpr std::string_view kInteractionLogFile = "received_data.log";

}  // namespace tgcast
