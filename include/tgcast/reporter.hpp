#pragma once

#include <string_view>

namespace tgcast {

enum class Severity { INFO, SUCCESS, WARNING, ERROR };

/// Sink for human-readable progress lines produced by the dispatch loops
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void report(std::string_view line, Severity severity) = 0;
};

/// Forward a line to `reporter`; a failing reporter never breaks the caller
void report_safely(ProgressReporter& reporter, std::string_view line, Severity severity) noexcept;

/// Prints coloured progress lines to stdout and mirrors them to spdlog at info level
class ConsoleReporter : public ProgressReporter {
public:
    explicit ConsoleReporter(bool use_colour = true) : use_colour_(use_colour) {}

    void report(std::string_view line, Severity severity) override;

private:
    bool use_colour_;
};

}  // namespace tgcast
