#include "tgcast/reporter.hpp"

#include "tgcast/formatters.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>

namespace tgcast {

void report_safely(ProgressReporter& reporter, std::string_view line, Severity severity) noexcept {
    try {
        reporter.report(line, severity);
    } catch (const std::exception& e) {
        spdlog::debug("Progress reporter failed: {}", e.what());
    } catch (...) {
        spdlog::debug("Progress reporter failed with a non-standard exception");
    }
}

void ConsoleReporter::report(std::string_view line, Severity severity) {
    spdlog::info("progress [{}] {}", severity, line);

    if (!use_colour_) {
        fmt::print("[{}] {}\n", severity, line);
        std::fflush(stdout);
        return;
    }

    fmt::text_style style;
    switch (severity) {
        case Severity::INFO:
            break;
        case Severity::SUCCESS:
            style = fmt::fg(fmt::terminal_color::green);
            break;
        case Severity::WARNING:
            style = fmt::fg(fmt::terminal_color::yellow);
            break;
        case Severity::ERROR:
            style = fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
            break;
    }
    fmt::print(style, "{}\n", line);
    std::fflush(stdout);
}

}  // namespace tgcast
