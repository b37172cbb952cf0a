#include "bot.hpp"
#include "broadcast.hpp"
#include "config.hpp"
#include "profile.hpp"

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdint>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
    CLI::App app{"tg-cast - Telegram bot broadcast dispatcher"};
    app.require_subcommand(1);

    int verbosity = 0;
    app.add_flag("-v,--verbose", verbosity, "Increase verbosity (-v, -vv)");

    // Config subcommand with nested subcommands
    auto* config_cmd = app.add_subcommand("config", "Manage configuration");
    config_cmd->require_subcommand(1);

    // config set
    auto* config_set_cmd = config_cmd->add_subcommand("set", "Set API credentials and bot token");
    std::optional<int32_t> api_id;
    std::optional<std::string> api_hash;
    std::optional<std::string> bot_token;
    std::optional<std::string> interaction_log;
    std::optional<bool> use_test_dc;
    config_set_cmd->add_option("--api-id", api_id, "Telegram API ID");
    config_set_cmd->add_option("--api-hash", api_hash, "Telegram API hash");
    config_set_cmd->add_option("--bot-token", bot_token, "Bot token from @BotFather");
    config_set_cmd->add_option("--interaction-log", interaction_log, "Path of the received-data log");
    config_set_cmd->add_option("--test-dc", use_test_dc, "Use the Telegram test data centre (true/false)");

    // config show
    auto* config_show_cmd = config_cmd->add_subcommand("show", "Show the stored configuration");

    // info
    auto* info_cmd = app.add_subcommand("info", "Show information about the bot");

    // profile with nested subcommands
    auto* profile_cmd = app.add_subcommand("profile", "Change the bot's public profile");
    profile_cmd->require_subcommand(1);

    auto* profile_name_cmd = profile_cmd->add_subcommand("name", "Set the bot's display name");
    std::string profile_name;
    profile_name_cmd->add_option("name", profile_name, "New name")->required();

    auto* profile_description_cmd =
        profile_cmd->add_subcommand("description", "Set the text shown in an empty chat with the bot");
    std::string profile_description;
    profile_description_cmd->add_option("text", profile_description, "Description, up to 512 characters")->required();

    auto* profile_about_cmd = profile_cmd->add_subcommand("about", "Set the short description on the bot's profile");
    std::string profile_about;
    profile_about_cmd->add_option("text", profile_about, "Short description, up to 120 characters")->required();

    auto* profile_photo_cmd = profile_cmd->add_subcommand("photo", "Set the bot's profile photo");
    std::string profile_photo;
    profile_photo_cmd->add_option("path", profile_photo, "Image file")->required()->check(CLI::ExistingFile);

    // collect
    auto* collect_cmd = app.add_subcommand("collect", "Log incoming messages and button presses");
    int collect_seconds = 60;
    collect_cmd->add_option("-t,--time", collect_seconds, "How long to listen, in seconds")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);

    // discover
    auto* discover_cmd = app.add_subcommand("discover", "List recipients found in the interaction log");

    // send
    auto* send_cmd = app.add_subcommand("send", "Send one message");
    std::string send_recipient;
    std::string send_text;
    std::string send_parse_mode = "html";
    bool send_mock = false;
    send_cmd->add_option("recipient", send_recipient, "Chat ID or @username")->required();
    send_cmd->add_option("text", send_text, "Message text")->required();
    send_cmd->add_option("--parse-mode", send_parse_mode, "none, html or markdown")->capture_default_str();
    send_cmd->add_flag("--mock", send_mock, "Use the mock transport (nothing is sent)");

    // spam
    auto* spam_cmd = app.add_subcommand("spam", "Send the same message several times to one recipient");
    std::string spam_recipient;
    std::string spam_text;
    int spam_count = 1;
    double spam_delay = 1.0;
    bool spam_mock = false;
    spam_cmd->add_option("recipient", spam_recipient, "Chat ID or @username")->required();
    spam_cmd->add_option("text", spam_text, "Message text")->required();
    spam_cmd->add_option("-n,--count", spam_count, "Number of messages")->capture_default_str();
    spam_cmd->add_option("-d,--delay", spam_delay, "Delay between messages, in seconds")->capture_default_str();
    spam_cmd->add_flag("--mock", spam_mock, "Use the mock transport (nothing is sent)");

    // broadcast
    auto* broadcast_cmd = app.add_subcommand("broadcast", "Send to every known recipient until time runs out");
    std::string broadcast_text;
    double broadcast_delay = 1.0;
    double broadcast_minutes = 1.0;
    bool broadcast_mock = false;
    broadcast_cmd->add_option("text", broadcast_text, "Message text")->required();
    broadcast_cmd->add_option("-d,--delay", broadcast_delay, "Delay between recipients, in seconds")
        ->capture_default_str();
    broadcast_cmd->add_option("-m,--minutes", broadcast_minutes, "How long to keep broadcasting, in minutes")
        ->capture_default_str();
    broadcast_cmd->add_flag("--mock", broadcast_mock, "Use the mock transport (nothing is sent)");

    CLI11_PARSE(app, argc, argv);

    tgcast::ctl::setup_logging(verbosity);

    // Handle subcommands
    if (config_set_cmd->parsed()) {
        return tgcast::ctl::exec_config_set(api_id, api_hash, bot_token, interaction_log, use_test_dc);
    }

    if (config_show_cmd->parsed()) {
        return tgcast::ctl::exec_config_show();
    }

    if (info_cmd->parsed()) {
        return tgcast::ctl::exec_info();
    }

    if (profile_name_cmd->parsed()) {
        return tgcast::ctl::exec_profile_name(profile_name);
    }

    if (profile_description_cmd->parsed()) {
        return tgcast::ctl::exec_profile_description(profile_description);
    }

    if (profile_about_cmd->parsed()) {
        return tgcast::ctl::exec_profile_about(profile_about);
    }

    if (profile_photo_cmd->parsed()) {
        return tgcast::ctl::exec_profile_photo(profile_photo);
    }

    if (collect_cmd->parsed()) {
        return tgcast::ctl::exec_collect(collect_seconds);
    }

    if (discover_cmd->parsed()) {
        return tgcast::ctl::exec_discover();
    }

    if (send_cmd->parsed()) {
        return tgcast::ctl::exec_send(send_recipient, send_text, send_parse_mode, send_mock);
    }

    if (spam_cmd->parsed()) {
        return tgcast::ctl::exec_spam(spam_recipient, spam_text, spam_count, spam_delay, spam_mock);
    }

    if (broadcast_cmd->parsed()) {
        return tgcast::ctl::exec_broadcast(broadcast_text, broadcast_delay, broadcast_minutes, broadcast_mock);
    }

    return 0;
}
