#include "broadcast.hpp"
#include "bot.hpp"
#include "config.hpp"

#include "tg/exceptions.hpp"
#include "tg/formatters.hpp"
#include "tgcast/discovery.hpp"
#include "tgcast/dispatcher.hpp"
#include "tgcast/interaction_log.hpp"
#include "tgcast/mock_transport.hpp"
#include "tgcast/td_transport.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>

namespace tgcast::ctl {

namespace {

/// Transport plus whatever keeps it alive
struct TransportHandle {
    std::unique_ptr<tg::BotClient> client;
    std::unique_ptr<Transport> transport;

    TransportHandle() = default;
    TransportHandle(TransportHandle&&) = default;
    TransportHandle& operator=(TransportHandle&&) = delete;

    ~TransportHandle() {
        transport.reset();
        if (client) {
            client->stop();
        }
    }
};

TransportHandle open_transport(const Config& config, bool mock) {
    TransportHandle handle;
    if (mock) {
        spdlog::info("Using mock transport, nothing will be sent");
        handle.transport = std::make_unique<MockTransport>();
        return handle;
    }

    handle.client = open_bot(config);
    handle.transport = std::make_unique<TdTransport>(*handle.client);
    return handle;
}

/// The mock transport never needs credentials
std::optional<Config> config_for(bool mock) {
    if (auto config = load_config()) {
        return config;
    }
    if (mock) {
        return read_config().value_or(Config{});
    }
    std::cerr << "Error: Bot not configured.\n";
    std::cerr << "Run 'tg-cast config set --api-id=XXX --api-hash=YYY --bot-token=ZZZ' first.\n";
    return std::nullopt;
}

int report_exit_code(const DispatchReport& report) { return report.success ? 0 : 1; }

template <typename Action>
int run_guarded(Action&& action) {
    try {
        return action();
    } catch (const tg::AuthenticationException& e) {
        std::cerr << "Error: " << e.what() << ". Check the token with 'tg-cast config show'.\n";
        return 1;
    } catch (const tg::TelegramException& e) {
        std::cerr << "Telegram error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace

int exec_send(const std::string& recipient, const std::string& text, const std::string& parse_mode, bool mock) {
    auto mode = tg::parse_mode_from_string(parse_mode);
    if (!mode) {
        std::cerr << "Error: Unknown parse mode '" << parse_mode << "' (expected none, html or markdown).\n";
        return 1;
    }

    auto config = config_for(mock);
    if (!config) {
        return 1;
    }

    return run_guarded([&] {
        auto handle = open_transport(*config, mock);
        InteractionLog log(get_interaction_log_path(*config));
        SteadyClock clock;
        SessionManager sessions;
        Dispatcher dispatcher(*handle.transport, sessions, clock, DispatcherOptions{.interaction_log = &log});

        auto result = dispatcher.send_once(recipient, text, *mode);
        if (!result.success) {
            std::cerr << "Error: " << result.message << "\n";
            return 1;
        }
        std::cout << result.message << "\n";
        return 0;
    });
}

int exec_spam(const std::string& recipient, const std::string& text, int count, double delay, bool mock) {
    auto config = config_for(mock);
    if (!config) {
        return 1;
    }

    return run_guarded([&] {
        auto handle = open_transport(*config, mock);
        SteadyClock clock;
        SessionManager sessions;
        Dispatcher dispatcher(*handle.transport, sessions, clock);
        ConsoleReporter reporter(isatty(STDOUT_FILENO) != 0);

        SingleTargetRequest request{
            .recipient = recipient,
            .text = text,
            .count = count,
            .delay = std::chrono::duration<double>(delay),
        };
        return report_exit_code(dispatcher.run_single_target(request, reporter));
    });
}

int exec_broadcast(const std::string& text, double delay, double minutes, bool mock) {
    auto config = config_for(mock);
    if (!config) {
        return 1;
    }

    auto discovery = discover_recipients(get_interaction_log_path(*config));
    if (!discovery.log_found) {
        std::cerr << "No interaction log at " << get_interaction_log_path(*config).string()
                  << ". Run 'tg-cast collect' first to gather recipients.\n";
        return 1;
    }

    return run_guarded([&] {
        auto handle = open_transport(*config, mock);
        SteadyClock clock;
        SessionManager sessions;
        Dispatcher dispatcher(*handle.transport, sessions, clock);
        ConsoleReporter reporter(isatty(STDOUT_FILENO) != 0);

        CyclicRequest request{
            .text = text,
            .delay = std::chrono::duration<double>(delay),
            .duration = std::chrono::duration<double, std::ratio<60>>(minutes),
        };
        return report_exit_code(dispatcher.run_cyclic(request, discovery.recipients, reporter));
    });
}

int exec_discover() {
    auto config = read_config().value_or(Config{});
    auto log_path = get_interaction_log_path(config);

    auto discovery = discover_recipients(log_path);
    if (!discovery.log_found) {
        std::cout << "No interaction log at " << log_path.string() << ". Run 'tg-cast collect' first.\n";
        return 0;
    }

    for (const auto& recipient : discovery.recipients) {
        std::cout << recipient.canonical() << "\n";
    }
    std::cout << discovery.recipients.size() << " recipient(s) found in " << discovery.lines_scanned << " line(s).\n";
    return 0;
}

}  // namespace tgcast::ctl
