#include "tgcast/formatters.hpp"

namespace tgcast::detail {

const std::unordered_map<Severity, std::string_view> severity_to_string_map = {
    {Severity::INFO, "info"},
    {Severity::SUCCESS, "ok"},
    {Severity::WARNING, "warning"},
    {Severity::ERROR, "error"},
};

const std::unordered_map<OutcomeKind, std::string_view> outcome_kind_to_string_map = {
    {OutcomeKind::DELIVERED, "delivered"},
    {OutcomeKind::RATE_LIMITED, "rate limited"},
    {OutcomeKind::INVALID_CREDENTIAL, "invalid credential"},
    {OutcomeKind::REJECTED, "rejected"},
    {OutcomeKind::TRANSPORT_FAILURE, "transport failure"},
};

const std::unordered_map<StopReason, std::string_view> stop_reason_to_string_map = {
    {StopReason::COMPLETED, "completed"},
    {StopReason::DEADLINE_EXPIRED, "deadline expired"},
    {StopReason::FATAL_CREDENTIAL, "invalid credential"},
    {StopReason::ABORTED, "aborted"},
    {StopReason::REJECTED_INPUT, "rejected input"},
    {StopReason::BUSY, "busy"},
};

const std::unordered_map<SessionMode, std::string_view> session_mode_to_string_map = {
    {SessionMode::SINGLE_TARGET, "single-target"},
    {SessionMode::CYCLIC, "cyclic"},
};

}  // namespace tgcast::detail
