#include "bot.hpp"

#include "tg/exceptions.hpp"
#include "tg/formatters.hpp"
#include "tgcast/interaction_log.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace tgcast::ctl {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted.store(true); }

}  // namespace

tg::BotClient::Config make_client_config(const Config& config) {
    auto data_dir = get_data_dir();

    tg::BotClient::Config client_config{};
    client_config.api_id = config.api_id;
    client_config.api_hash = config.api_hash;
    client_config.bot_token = config.bot_token;
    client_config.database_directory = (data_dir / "tdlib").string();
    client_config.files_directory = (data_dir / "files").string();
    client_config.logs_directory = (data_dir / "logs").string();
    client_config.use_test_dc = config.use_test_dc;

    // Ensure directories exist
    std::filesystem::create_directories(client_config.database_directory);
    std::filesystem::create_directories(client_config.files_directory);

    return client_config;
}

std::unique_ptr<tg::BotClient> open_bot(const Config& config) {
    auto client = std::make_unique<tg::BotClient>(make_client_config(config));

    spdlog::debug("Starting Telegram client...");
    client->start();
    client->wait_until_ready();
    return client;
}

int exec_info() {
    auto config = load_config();
    if (!config) {
        std::cerr << "Error: Bot not configured.\n";
        std::cerr << "Run 'tg-cast config set --api-id=XXX --api-hash=YYY --bot-token=ZZZ' first.\n";
        return 1;
    }

    try {
        auto client = open_bot(*config);
        auto me = client->get_me();

        std::cout << "Bot info:\n";
        std::cout << "  ID:       " << me.id << "\n";
        std::cout << "  Name:     " << me.display_name() << "\n";
        std::cout << "  Username: " << fmt::format("{:u}", me) << "\n";
        spdlog::info("Fetched bot info for {:u}", me);

        client->stop();
        return 0;

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

int exec_collect(int seconds) {
    if (seconds <= 0) {
        std::cerr << "Error: Collection time must be greater than zero.\n";
        return 1;
    }

    auto config = load_config();
    if (!config) {
        std::cerr << "Error: Bot not configured.\n";
        std::cerr << "Run 'tg-cast config set --api-id=XXX --api-hash=YYY --bot-token=ZZZ' first.\n";
        return 1;
    }

    InteractionLog log(get_interaction_log_path(*config));
    std::atomic<int> messages{0};
    std::atomic<int> queries{0};

    try {
        auto client = open_bot(*config);

        client->set_message_callback([&](const tg::Message& message) {
            if (log.append(format_incoming(message))) {
                ++messages;
            }
        });
        client->set_callback_query_callback([&](const tg::CallbackQuery& query) {
            if (log.append(format_callback_query(query))) {
                ++queries;
            }
        });

        std::cout << "Collecting updates for " << seconds << "s into " << log.path().string()
                  << " (Ctrl+C to stop early)..." << std::endl;

        g_interrupted.store(false);
        auto previous_handler = std::signal(SIGINT, handle_interrupt);

        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        while (std::chrono::steady_clock::now() < until && !g_interrupted.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::signal(SIGINT, previous_handler);

        client->set_message_callback(nullptr);
        client->set_callback_query_callback(nullptr);
        client->stop();

        std::cout << "Logged " << messages.load() << " message(s) and " << queries.load() << " callback query(ies).\n";
        spdlog::info("Collection finished: {} messages, {} callback queries", messages.load(), queries.load());
        return 0;

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

}  // namespace tgcast::ctl
