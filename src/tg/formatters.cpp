#include "tg/formatters.hpp"

namespace tg::detail {

const std::unordered_map<ChatType, std::string_view> chat_type_to_string_map = {
    {ChatType::PRIVATE, "private"},
    {ChatType::GROUP, "group"},
    {ChatType::SUPERGROUP, "supergroup"},
    {ChatType::CHANNEL, "channel"},
};

const std::unordered_map<MediaType, std::string_view> media_type_to_string_map = {
    {MediaType::PHOTO, "photo"},
    {MediaType::VIDEO, "video"},
    {MediaType::DOCUMENT, "document"},
    {MediaType::AUDIO, "audio"},
    {MediaType::VOICE, "voice"},
    {MediaType::ANIMATION, "animation"},
    {MediaType::STICKER, "sticker"},
    {MediaType::VIDEO_NOTE, "video note"},
};

const std::unordered_map<ParseMode, std::string_view> parse_mode_to_string_map = {
    {ParseMode::NONE, "none"},
    {ParseMode::HTML, "html"},
    {ParseMode::MARKDOWN, "markdown"},
};

}  // namespace tg::detail
