#include "tgcast/profile.hpp"

#include "tg/exceptions.hpp"
#include "tgcast/constants.hpp"
#include "tgcast/text.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace tgcast {
namespace {

// Records every call and optionally fails the next one
class RecordingBackend : public ProfileBackend {
public:
    void set_name(const std::string& name) override { record("name", name); }
    void set_description(const std::string& description) override { record("description", description); }
    void set_short_description(const std::string& short_description) override {
        record("short_description", short_description);
    }
    void set_photo(const std::filesystem::path& photo) override { record("photo", photo.string()); }

    void fail_next(std::string reason) { failure_ = std::move(reason); }

    std::vector<std::pair<std::string, std::string>> calls;

private:
    void record(std::string field, std::string value) {
        if (failure_) {
            auto reason = *failure_;
            failure_.reset();
            throw tg::BadRequestException(reason);
        }
        calls.emplace_back(std::move(field), std::move(value));
    }

    std::optional<std::string> failure_;
};

class ProfileEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "tgcast_profile_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    RecordingBackend backend_;
    ProfileEditor editor_{backend_};
};

TEST_F(ProfileEditorTest, SetName) {
    auto result = editor_.set_name("Cast Bot");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Bot name changed to: Cast Bot");
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].first, "name");
    EXPECT_EQ(backend_.calls[0].second, "Cast Bot");
}

TEST_F(ProfileEditorTest, EmptyNameRejected) {
    auto result = editor_.set_name("");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Bot name is empty.");
    EXPECT_TRUE(backend_.calls.empty());
}

// Test Telegram's length limits on the descriptions
TEST_F(ProfileEditorTest, DescriptionCutToLimit) {
    std::string long_text;
    for (std::size_t i = 0; i < kMaxBotDescriptionLength + 10; ++i) {
        long_text += "ж";
    }

    EXPECT_TRUE(editor_.set_description(long_text).success);

    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(utf8_length(backend_.calls[0].second), kMaxBotDescriptionLength);
}

TEST_F(ProfileEditorTest, ShortDescriptionCutToLimit) {
    std::string long_text(kMaxBotShortDescriptionLength + 1, 'a');

    auto result = editor_.set_short_description(long_text);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Bot short description updated.");
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].first, "short_description");
    EXPECT_EQ(backend_.calls[0].second, std::string(kMaxBotShortDescriptionLength, 'a'));
}

TEST_F(ProfileEditorTest, ShortTextsPassUnchanged) {
    EXPECT_TRUE(editor_.set_description("Broadcasts news").success);
    EXPECT_TRUE(editor_.set_short_description("").success);

    ASSERT_EQ(backend_.calls.size(), 2u);
    EXPECT_EQ(backend_.calls[0].second, "Broadcasts news");
    EXPECT_EQ(backend_.calls[1].second, "");
}

// Test the photo file checks
TEST_F(ProfileEditorTest, MissingPhotoRejected) {
    auto missing = dir_ / "nope.jpg";

    auto result = editor_.set_photo(missing);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Profile photo not found: " + missing.string());
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(ProfileEditorTest, DirectoryIsNotAPhoto) {
    EXPECT_FALSE(editor_.set_photo(dir_).success);
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(ProfileEditorTest, ExistingPhotoUploaded) {
    auto photo = dir_ / "avatar.jpg";
    std::ofstream(photo) << "jpeg";

    auto result = editor_.set_photo(photo);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Profile photo set from " + photo.string() + ".");
    ASSERT_EQ(backend_.calls.size(), 1u);
    EXPECT_EQ(backend_.calls[0].second, photo.string());
}

// Test that Telegram errors become a failed result
TEST_F(ProfileEditorTest, BackendErrorReported) {
    backend_.fail_next("BOT_TITLE_INVALID");

    auto result = editor_.set_name("x");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Failed to change the bot name: Bad request: BOT_TITLE_INVALID");
    EXPECT_TRUE(backend_.calls.empty());

    EXPECT_TRUE(editor_.set_name("y").success);
}

}  // namespace
}  // namespace tgcast
