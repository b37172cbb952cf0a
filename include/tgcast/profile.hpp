#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace tgcast {

/// Editable parts of the bot's own profile
///
/// Implementations throw the tg exception hierarchy on failure.
class ProfileBackend {
public:
    virtual ~ProfileBackend() = default;

    virtual void set_name(const std::string& name) = 0;
    virtual void set_description(const std::string& description) = 0;
    virtual void set_short_description(const std::string& short_description) = 0;
    virtual void set_photo(const std::filesystem::path& photo) = 0;
};

struct ProfileResult {
    bool success{false};
    std::string message;
};

/// Applies profile changes with Telegram's length limits and reports the result
class ProfileEditor {
public:
    explicit ProfileEditor(ProfileBackend& backend);

    ProfileResult set_name(std::string_view name);

    /// Text shown in an empty chat with the bot, cut to kMaxBotDescriptionLength
    ProfileResult set_description(std::string_view description);

    /// The "about" text on the bot's profile, cut to kMaxBotShortDescriptionLength
    ProfileResult set_short_description(std::string_view short_description);

    /// `photo` must be an existing regular file
    ProfileResult set_photo(const std::filesystem::path& photo);

private:
    template <typename Action>
    ProfileResult apply(std::string_view what, Action&& action, std::string done);

    ProfileBackend& backend_;
};

}  // namespace tgcast
