#include "tgcast/profile.hpp"

#include "tg/exceptions.hpp"
#include "tgcast/constants.hpp"
#include "tgcast/text.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace tgcast {

namespace {

std::string cut_to(std::string_view text, std::size_t limit, std::string_view what) {
    auto prefix = utf8_prefix(text, limit);
    if (prefix.size() < text.size()) {
        spdlog::info("Bot {} cut to {} characters", what, limit);
    }
    return std::string(prefix);
}

}  // namespace

ProfileEditor::ProfileEditor(ProfileBackend& backend) : backend_(backend) {}

template <typename Action>
ProfileResult ProfileEditor::apply(std::string_view what, Action&& action, std::string done) {
    try {
        action();
    } catch (const tg::TelegramException& e) {
        auto message = fmt::format("Failed to change the bot {}: {}", what, e.what());
        spdlog::error("{}", message);
        return ProfileResult{.success = false, .message = std::move(message)};
    }

    spdlog::info("{}", done);
    return ProfileResult{.success = true, .message = std::move(done)};
}

ProfileResult ProfileEditor::set_name(std::string_view name) {
    if (name.empty()) {
        return ProfileResult{.success = false, .message = "Bot name is empty."};
    }

    std::string value(name);
    return apply("name", [&] { backend_.set_name(value); }, fmt::format("Bot name changed to: {}", value));
}

ProfileResult ProfileEditor::set_description(std::string_view description) {
    auto value = cut_to(description, kMaxBotDescriptionLength, "description");
    return apply("description", [&] { backend_.set_description(value); }, "Bot description updated.");
}

ProfileResult ProfileEditor::set_short_description(std::string_view short_description) {
    auto value = cut_to(short_description, kMaxBotShortDescriptionLength, "short description");
    return apply(
        "short description", [&] { backend_.set_short_description(value); }, "Bot short description updated."
    );
}

ProfileResult ProfileEditor::set_photo(const std::filesystem::path& photo) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(photo, ec)) {
        auto message = fmt::format("Profile photo not found: {}", photo.string());
        spdlog::error("{}", message);
        return ProfileResult{.success = false, .message = std::move(message)};
    }

    return apply(
        "profile photo",
        [&] { backend_.set_photo(photo); },
        fmt::format("Profile photo set from {}.", photo.string())
    );
}

}  // namespace tgcast
