#include "tgcast/discovery.hpp"

#include "tgcast/interaction_log.hpp"

#include <gtest/gtest.h>

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace tgcast {
namespace {

namespace fs = std::filesystem;

std::vector<std::string> canonical_forms(const RecipientSet& recipients) {
    std::vector<std::string> result;
    for (const auto& r : recipients) {
        result.push_back(r.canonical());
    }
    return result;
}

RecipientSet scan(std::string_view text) {
    std::istringstream input{std::string(text)};
    return discover_recipients(input).recipients;
}

// Test fixture for file-based discovery
class DiscoveryFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        dir_ = fs::temp_directory_path() / ("tgcast_discovery_" + std::string(name) + "_" + std::to_string(getpid()));
        fs::create_directories(dir_);
        log_path_ = dir_ / "received_data.log";
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write_log(const std::string& contents) {
        std::ofstream file(log_path_);
        file << contents;
    }

    fs::path dir_;
    fs::path log_path_;
};

// Test the reference example: chat id, sender id with handle, one unmatched line
TEST(DiscoveryTest, ReferenceExample) {
    auto recipients = scan(
        "2024-01-01 10:00:00 - OUTGOING; Chat: 12345; Content: Text: 'hi'\n"
        "2024-01-01 10:00:01 - something Sender: 999 (@alice) happened\n"
        "2024-01-01 10:00:02 - nothing to see here\n"
    );

    EXPECT_EQ(canonical_forms(recipients), (std::vector<std::string>{"12345", "999", "@alice"}));
}

// Test the six reference kinds
TEST(DiscoveryTest, ChatById) {
    RecipientSet out;
    EXPECT_EQ(collect_recipients("Chat: -1001234567890 (Group title)", out), 1u);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"-1001234567890"}));
}

TEST(DiscoveryTest, ChatByHandle) {
    RecipientSet out;
    collect_recipients("INCOMING; MessageID: 1; Chat: -100500 (@newsroom)", out);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"-100500", "@newsroom"}));
}

TEST(DiscoveryTest, SenderByIdWithoutHandle) {
    RecipientSet out;
    collect_recipients("INCOMING; MessageID: 2; Chat: 77 (Private); Sender: 77; Content: Text: 'yo'", out);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"77"}));
}

TEST(DiscoveryTest, CallbackQueryOrigin) {
    RecipientSet out;
    auto found = collect_recipients("INCOMING; CallbackQuery: From=4242 (@clicker), Data='buy', MsgID=9", out);
    EXPECT_EQ(found, 2u);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"4242", "@clicker"}));
}

TEST(DiscoveryTest, CallbackQueryWithoutHandle) {
    RecipientSet out;
    collect_recipients("INCOMING; CallbackQuery: From=4242, Data='x (@fake)', MsgID=9", out);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"4242"}));
}

// Test that a full incoming line yields chat and sender references
TEST(DiscoveryTest, IncomingLineFromFormatter) {
    tg::Message message;
    message.id = 10;
    message.chat_id = -100777;
    message.chat_title = "Dev chat";
    message.sender_id = 31337;
    message.sender_username = "neo";
    message.text = "hello";

    RecipientSet out;
    collect_recipients(format_incoming(message), out);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"-100777", "31337", "@neo"}));
}

// Test that message payload is never mistaken for references
TEST(DiscoveryTest, ContentIsIgnored) {
    RecipientSet out;
    auto found = collect_recipients(
        "OUTGOING; Chat: 5; Content: Text: 'ping Chat: 666 and Sender: 777 (@evil) CallbackQuery: From=888'", out
    );
    EXPECT_EQ(found, 1u);
    EXPECT_EQ(canonical_forms(out), (std::vector<std::string>{"5"}));
}

TEST(DiscoveryTest, UnmatchedLinesContributeNothing) {
    RecipientSet out;
    EXPECT_EQ(collect_recipients("", out), 0u);
    EXPECT_EQ(collect_recipients("Chat: abc", out), 0u);
    EXPECT_EQ(collect_recipients("garbage (@ ) ))) ((( ;;;", out), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(DiscoveryTest, OutOfRangeIdSkipped) {
    RecipientSet out;
    collect_recipients("Chat: 99999999999999999999999", out);
    EXPECT_TRUE(out.empty());
}

TEST(DiscoveryTest, DuplicatesCollapse) {
    auto recipients = scan(
        "Chat: 1\n"
        "Chat: 1\n"
        "INCOMING; MessageID: 3; Chat: 1 (Private); Sender: 1 (@one)\n"
    );
    EXPECT_EQ(canonical_forms(recipients), (std::vector<std::string>{"1", "@one"}));
}

TEST(DiscoveryTest, CountsScannedLines) {
    std::istringstream input("a\nb\nChat: 3\n");
    auto result = discover_recipients(input);
    EXPECT_TRUE(result.log_found);
    EXPECT_EQ(result.lines_scanned, 3u);
    EXPECT_EQ(result.recipients.size(), 1u);
}

// Test discovery on files
TEST_F(DiscoveryFileTest, MissingLogYieldsEmptySet) {
    auto result = discover_recipients(dir_ / "does_not_exist.log");

    EXPECT_FALSE(result.log_found);
    EXPECT_TRUE(result.recipients.empty());
    EXPECT_EQ(result.lines_scanned, 0u);
}

TEST_F(DiscoveryFileTest, ReadsLogFile) {
    write_log(
        "2024-01-01 10:00:00 - INCOMING; MessageID: 1; Chat: 10 (Private); Sender: 10 (@ten); Content: Text: 'a'\n"
        "2024-01-01 10:00:05 - INCOMING; CallbackQuery: From=20, Data='b', MsgID=1\n"
    );

    auto result = discover_recipients(log_path_);

    EXPECT_TRUE(result.log_found);
    EXPECT_EQ(canonical_forms(result.recipients), (std::vector<std::string>{"10", "20", "@ten"}));
}

TEST_F(DiscoveryFileTest, DiscoveryIsIdempotent) {
    write_log(
        "Chat: 1\n"
        "Sender: 2 (@two)\n"
        "CallbackQuery: From=3 (@three), Data='x'\n"
    );

    auto first = discover_recipients(log_path_);
    auto second = discover_recipients(log_path_);

    EXPECT_EQ(first.recipients, second.recipients);
    EXPECT_EQ(first.recipients.size(), 5u);
}

TEST_F(DiscoveryFileTest, EmptyLogIsFoundButEmpty) {
    write_log("");

    auto result = discover_recipients(log_path_);
    EXPECT_TRUE(result.log_found);
    EXPECT_TRUE(result.recipients.empty());
}

}  // namespace
}  // namespace tgcast
