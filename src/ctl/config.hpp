#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tgcast::ctl {

/// Application configuration (API credentials and bot token)
struct Config {
    int32_t api_id = 0;
    std::string api_hash;
    std::string bot_token;
    std::string interaction_log;  // Empty means <data dir>/received_data.log
    bool use_test_dc = false;

    bool is_valid() const { return api_id != 0 && !api_hash.empty() && !bot_token.empty(); }
};

/// Get XDG config directory (~/.config/tg-cast)
std::filesystem::path get_config_dir();

/// Get XDG data directory (~/.local/share/tg-cast)
std::filesystem::path get_data_dir();

/// Get config file path (~/.config/tg-cast/config.json)
std::filesystem::path get_config_path();

/// Read whatever the config file holds, valid or not
/// Returns std::nullopt if the file doesn't exist or cannot be parsed
std::optional<Config> read_config();

/// Load configuration from disk
/// Returns std::nullopt if config file doesn't exist or is incomplete
std::optional<Config> load_config();

/// Save configuration to disk
/// Creates directories if needed
void save_config(const Config& config);

/// Received-data log used by collect, send and discovery
std::filesystem::path get_interaction_log_path(const Config& config);

/// Bot token with everything but the last five characters hidden
std::string mask_token(const std::string& token);

/// Execute config set command; unset options keep their stored value
int exec_config_set(
    std::optional<int32_t> api_id,
    std::optional<std::string> api_hash,
    std::optional<std::string> bot_token,
    std::optional<std::string> interaction_log,
    std::optional<bool> use_test_dc
);

/// Execute config show command
int exec_config_show();

/// Install the default logger: rotating file in the data directory plus
/// errors on stderr. Verbosity 1 enables debug, 2 and above trace.
void setup_logging(int verbosity);

}  // namespace tgcast::ctl
