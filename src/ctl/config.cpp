#include "config.hpp"

#include "tgcast/constants.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

namespace tgcast::ctl {

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr std::size_t kVisibleTokenChars = 5;

std::filesystem::path get_xdg_config_home() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config";
    }
    return ".config";
}

std::filesystem::path get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share";
    }
    return ".local/share";
}

}  // namespace

std::filesystem::path get_config_dir() { return get_xdg_config_home() / "tg-cast"; }

std::filesystem::path get_data_dir() { return get_xdg_data_home() / "tg-cast"; }

std::filesystem::path get_config_path() { return get_config_dir() / "config.json"; }

std::optional<Config> read_config() {
    auto path = get_config_path();

    if (!std::filesystem::exists(path)) {
        spdlog::debug("Config file not found: {}", path.string());
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open config file: {}", path.string());
            return std::nullopt;
        }

        nlohmann::json j;
        file >> j;

        Config config;
        config.api_id = j.value("api_id", 0);
        config.api_hash = j.value("api_hash", "");
        config.bot_token = j.value("bot_token", "");
        config.interaction_log = j.value("interaction_log", "");
        config.use_test_dc = j.value("use_test_dc", false);

        spdlog::debug("Loaded config from {}", path.string());
        return config;

    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse config file: {}", e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to read config file: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Config> load_config() {
    auto config = read_config();
    if (!config) {
        return std::nullopt;
    }
    if (!config->is_valid()) {
        spdlog::warn("Config file has invalid or missing credentials");
        return std::nullopt;
    }
    return config;
}

void save_config(const Config& config) {
    auto dir = get_config_dir();
    auto path = get_config_path();

    // Create directory if needed
    std::filesystem::create_directories(dir);

    nlohmann::json j;
    j["api_id"] = config.api_id;
    j["api_hash"] = config.api_hash;
    j["bot_token"] = config.bot_token;
    if (!config.interaction_log.empty()) {
        j["interaction_log"] = config.interaction_log;
    }
    if (config.use_test_dc) {
        j["use_test_dc"] = true;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path.string());
    }

    file << j.dump(2) << std::endl;
    spdlog::info("Configuration saved to {}", path.string());
}

std::filesystem::path get_interaction_log_path(const Config& config) {
    if (!config.interaction_log.empty()) {
        return config.interaction_log;
    }
    return get_data_dir() / std::string(kInteractionLogFile);
}

std::string mask_token(const std::string& token) {
    if (token.empty()) {
        return "(not set)";
    }
    if (token.size() <= kVisibleTokenChars) {
        return std::string(token.size(), '*');
    }
    return std::string(token.size() - kVisibleTokenChars, '*') + token.substr(token.size() - kVisibleTokenChars);
}

int exec_config_set(
    std::optional<int32_t> api_id,
    std::optional<std::string> api_hash,
    std::optional<std::string> bot_token,
    std::optional<std::string> interaction_log,
    std::optional<bool> use_test_dc
) {
    if (api_id && *api_id <= 0) {
        std::cerr << "Error: API ID must be a positive number.\n";
        return 1;
    }
    if (api_hash && api_hash->empty()) {
        std::cerr << "Error: API hash cannot be empty.\n";
        return 1;
    }
    if (bot_token && bot_token->empty()) {
        std::cerr << "Error: Bot token cannot be empty.\n";
        return 1;
    }

    auto config = read_config().value_or(Config{});
    if (api_id) config.api_id = *api_id;
    if (api_hash) config.api_hash = *api_hash;
    if (bot_token) config.bot_token = *bot_token;
    if (interaction_log) config.interaction_log = *interaction_log;
    if (use_test_dc) config.use_test_dc = *use_test_dc;

    try {
        save_config(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!config.is_valid()) {
        std::cout << "Saved. Still missing:";
        if (config.api_id == 0) std::cout << " --api-id";
        if (config.api_hash.empty()) std::cout << " --api-hash";
        if (config.bot_token.empty()) std::cout << " --bot-token";
        std::cout << "\n";
    }
    return 0;
}

int exec_config_show() {
    auto config = read_config();
    if (!config) {
        std::cerr << "No configuration found at " << get_config_path().string() << ".\n";
        std::cerr << "Run 'tg-cast config set --api-id=XXX --api-hash=YYY --bot-token=ZZZ' first.\n";
        return 1;
    }

    std::cout << "Config file:     " << get_config_path().string() << "\n";
    std::cout << "API ID:          " << (config->api_id != 0 ? std::to_string(config->api_id) : "(not set)") << "\n";
    std::cout << "API hash:        " << (config->api_hash.empty() ? "(not set)" : "(set)") << "\n";
    std::cout << "Bot token:       " << mask_token(config->bot_token) << "\n";
    std::cout << "Interaction log: " << get_interaction_log_path(*config).string() << "\n";
    std::cout << "Test DC:         " << (config->use_test_dc ? "yes" : "no") << "\n";
    return config->is_valid() ? 0 : 1;
}

void setup_logging(int verbosity) {
    auto level = spdlog::level::info;
    if (verbosity >= 2) {
        level = spdlog::level::trace;
    } else if (verbosity == 1) {
        level = spdlog::level::debug;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(verbosity > 0 ? level : spdlog::level::err);
    sinks.push_back(console_sink);

    try {
        auto logs_dir = get_data_dir() / "logs";
        std::filesystem::create_directories(logs_dir);
        auto log_path = (logs_dir / "tg-cast.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
        // Continue with the console sink only
        std::cerr << "Warning: Could not set up file logging: " << e.what() << "\n";
    }

    auto logger = std::make_shared<spdlog::logger>("tg-cast", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

}  // namespace tgcast::ctl
