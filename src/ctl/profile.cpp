#include "profile.hpp"
#include "bot.hpp"
#include "config.hpp"

#include "tg/exceptions.hpp"
#include "tgcast/profile.hpp"
#include "tgcast/td_transport.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace tgcast::ctl {

namespace {

template <typename Change>
int edit_profile(Change&& change) {
    auto config = load_config();
    if (!config) {
        std::cerr << "Error: Bot not configured.\n";
        std::cerr << "Run 'tg-cast config set --api-id=XXX --api-hash=YYY --bot-token=ZZZ' first.\n";
        return 1;
    }

    try {
        auto client = open_bot(*config);
        TdProfileBackend backend(*client);
        ProfileEditor editor(backend);

        auto result = change(editor);
        client->stop();

        if (!result.success) {
            std::cerr << "Error: " << result.message << "\n";
            return 1;
        }
        std::cout << result.message << "\n";
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

}  // namespace

int exec_profile_name(const std::string& name) {
    return edit_profile([&](ProfileEditor& editor) { return editor.set_name(name); });
}

int exec_profile_description(const std::string& description) {
    return edit_profile([&](ProfileEditor& editor) { return editor.set_description(description); });
}

int exec_profile_about(const std::string& about) {
    return edit_profile([&](ProfileEditor& editor) { return editor.set_short_description(about); });
}

int exec_profile_photo(const std::string& path) {
    // Checked before connecting so a typo does not cost a login
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "Error: Profile photo not found: " << path << "\n";
        return 1;
    }
    return edit_profile([&](ProfileEditor& editor) { return editor.set_photo(path); });
}

}  // namespace tgcast::ctl
