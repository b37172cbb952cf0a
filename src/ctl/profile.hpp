#pragma once

#include <string>

namespace tgcast::ctl {

/// Execute profile name command
int exec_profile_name(const std::string& name);

/// Execute profile description command - text shown in an empty chat with the bot
int exec_profile_description(const std::string& description);

/// Execute profile about command - short description on the bot's profile
int exec_profile_about(const std::string& about);

/// Execute profile photo command - upload a local image as the avatar
int exec_profile_photo(const std::string& path);

}  // namespace tgcast::ctl
