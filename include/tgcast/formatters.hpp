#pragma once

#include "tgcast/outcome.hpp"
#include "tgcast/reporter.hpp"
#include "tgcast/session.hpp"

#include <string_view>
#include <unordered_map>

#include <fmt/format.h>

namespace tgcast::detail {

extern const std::unordered_map<Severity, std::string_view> severity_to_string_map;
extern const std::unordered_map<OutcomeKind, std::string_view> outcome_kind_to_string_map;
extern const std::unordered_map<StopReason, std::string_view> stop_reason_to_string_map;
extern const std::unordered_map<SessionMode, std::string_view> session_mode_to_string_map;

}  // namespace tgcast::detail

template <>
struct fmt::formatter<tgcast::Severity> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tgcast::Severity severity, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tgcast::detail::severity_to_string_map.at(severity), ctx);
    }
};

template <>
struct fmt::formatter<tgcast::OutcomeKind> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tgcast::OutcomeKind kind, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tgcast::detail::outcome_kind_to_string_map.at(kind), ctx);
    }
};

template <>
struct fmt::formatter<tgcast::StopReason> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tgcast::StopReason reason, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tgcast::detail::stop_reason_to_string_map.at(reason), ctx);
    }
};

template <>
struct fmt::formatter<tgcast::SessionMode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tgcast::SessionMode mode, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tgcast::detail::session_mode_to_string_map.at(mode), ctx);
    }
};
