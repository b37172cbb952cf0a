#include "tgcast/interaction_log.hpp"

#include <gtest/gtest.h>

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace tgcast {
namespace {

namespace fs = std::filesystem;

// Test fixture with a private temporary directory
class InteractionLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        dir_ = fs::temp_directory_path() / ("tgcast_log_" + std::string(name) + "_" + std::to_string(getpid()));
        fs::remove_all(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::vector<std::string> read_lines(const fs::path& path) {
        std::vector<std::string> lines;
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    fs::path dir_;
};

// Test that append creates missing directories and prefixes a timestamp
TEST_F(InteractionLogTest, AppendCreatesFileWithTimestamp) {
    InteractionLog log(dir_ / "nested" / "received_data.log");
    EXPECT_FALSE(log.exists());

    ASSERT_TRUE(log.append("OUTGOING; Chat: 1; Content: Text: 'x'"));
    EXPECT_TRUE(log.exists());

    auto lines = read_lines(log.path());
    ASSERT_EQ(lines.size(), 1u);
    // "YYYY-MM-DD HH:MM:SS - " is 22 characters
    ASSERT_GT(lines[0].size(), 22u);
    EXPECT_EQ(lines[0].substr(19, 3), " - ");
    EXPECT_EQ(lines[0].substr(22), "OUTGOING; Chat: 1; Content: Text: 'x'");
}

TEST_F(InteractionLogTest, AppendKeepsExistingLines) {
    InteractionLog log(dir_ / "received_data.log");
    ASSERT_TRUE(log.append("first"));
    ASSERT_TRUE(log.append("second"));

    auto lines = read_lines(log.path());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].substr(22), "first");
    EXPECT_EQ(lines[1].substr(22), "second");
}

// Test that an unwritable path is reported, not thrown
TEST_F(InteractionLogTest, AppendFailureReturnsFalse) {
    fs::create_directories(dir_);
    std::ofstream(dir_ / "blocker") << "file";

    InteractionLog log(dir_ / "blocker" / "received_data.log");
    EXPECT_FALSE(log.append("line"));
}

// Test line formatters
TEST(InteractionLogFormatTest, OutgoingById) {
    EXPECT_EQ(
        format_outgoing(tg::Recipient::from_id(-100123), "Hello"), "OUTGOING; Chat: -100123; Content: Text: 'Hello'"
    );
}

TEST(InteractionLogFormatTest, OutgoingByHandle) {
    EXPECT_EQ(format_outgoing(tg::Recipient::from_handle("alice"), "Hi"), "OUTGOING; Chat: @alice; Content: Text: 'Hi'");
}

TEST(InteractionLogFormatTest, OutgoingTruncatesText) {
    std::string text(200, 'a');
    auto line = format_outgoing(tg::Recipient::from_id(1), text);

    EXPECT_EQ(line, "OUTGOING; Chat: 1; Content: Text: '" + std::string(150, 'a') + "...'");
}

TEST(InteractionLogFormatTest, OutgoingFlattensNewlines) {
    EXPECT_EQ(
        format_outgoing(tg::Recipient::from_id(1), "two\nlines"), "OUTGOING; Chat: 1; Content: Text: 'two lines'"
    );
}

TEST(InteractionLogFormatTest, IncomingPrivateText) {
    tg::Message message;
    message.id = 5;
    message.chat_id = 42;
    message.sender_id = 42;
    message.sender_username = "bob";
    message.text = "hey";

    EXPECT_EQ(
        format_incoming(message), "INCOMING; MessageID: 5; Chat: 42 (Private); Sender: 42 (@bob); Content: Text: 'hey'"
    );
}

TEST(InteractionLogFormatTest, IncomingPublicGroupUsesHandle) {
    tg::Message message;
    message.id = 6;
    message.chat_id = -100900;
    message.chat_title = "Ignored title";
    message.chat_username = "publicgroup";
    message.sender_id = 7;
    message.text = "x";

    EXPECT_EQ(
        format_incoming(message),
        "INCOMING; MessageID: 6; Chat: -100900 (@publicgroup); Sender: 7; Content: Text: 'x'"
    );
}

TEST(InteractionLogFormatTest, IncomingSanitisesTitle) {
    tg::Message message;
    message.id = 8;
    message.chat_id = -5;
    message.chat_title = "Fans (official); Sender: 1";
    message.sender_id = 9;

    EXPECT_EQ(
        format_incoming(message),
        "INCOMING; MessageID: 8; Chat: -5 (Fans  official   Sender  1); Sender: 9; Content: Text: ''"
    );
}

TEST(InteractionLogFormatTest, IncomingMediaWithCaption) {
    tg::Message message;
    message.id = 11;
    message.chat_id = 3;
    message.sender_id = 3;
    message.media = tg::MediaType::PHOTO;
    message.text = "look";

    EXPECT_EQ(
        format_incoming(message), "INCOMING; MessageID: 11; Chat: 3 (Private); Sender: 3; Content: photo, Caption: 'look'"
    );
}

TEST(InteractionLogFormatTest, IncomingChannelPostHasNoSender) {
    tg::Message message;
    message.id = 12;
    message.chat_id = -1009;
    message.chat_title = "Channel";
    message.text = "news";

    EXPECT_EQ(format_incoming(message), "INCOMING; MessageID: 12; Chat: -1009 (Channel); Content: Text: 'news'");
}

TEST(InteractionLogFormatTest, CallbackQuery) {
    tg::CallbackQuery query;
    query.sender_id = 77;
    query.sender_username = "presser";
    query.message_id = 3;
    query.data = "btn_1";

    EXPECT_EQ(format_callback_query(query), "INCOMING; CallbackQuery: From=77 (@presser), Data='btn_1', MsgID=3");
}

TEST(InteractionLogFormatTest, CallbackQueryWithoutUsername) {
    tg::CallbackQuery query;
    query.sender_id = 77;
    query.message_id = 3;

    EXPECT_EQ(format_callback_query(query), "INCOMING; CallbackQuery: From=77, Data='', MsgID=3");
}

}  // namespace
}  // namespace tgcast
