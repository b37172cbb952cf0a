#include "tg/types.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace tg {
namespace {

// Test Recipient parsing
TEST(TypesTest, RecipientParseNumericId) {
    auto recipient = Recipient::parse("12345");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_TRUE(recipient->is_id());
    EXPECT_EQ(recipient->id(), 12345);
    EXPECT_EQ(recipient->canonical(), "12345");
}

TEST(TypesTest, RecipientParseNegativeId) {
    auto recipient = Recipient::parse("-1001234567890");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_TRUE(recipient->is_id());
    EXPECT_EQ(recipient->id(), -1001234567890);
    EXPECT_EQ(recipient->canonical(), "-1001234567890");
}

TEST(TypesTest, RecipientParseHandleAddsAt) {
    auto recipient = Recipient::parse("alice");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_TRUE(recipient->is_handle());
    EXPECT_EQ(recipient->username(), "alice");
    EXPECT_EQ(recipient->canonical(), "@alice");
}

TEST(TypesTest, RecipientParseHandleKeepsSingleAt) {
    auto recipient = Recipient::parse("@alice");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_EQ(recipient->canonical(), "@alice");
    EXPECT_FALSE(recipient->id().has_value());
}

TEST(TypesTest, RecipientParseTrimsWhitespace) {
    auto recipient = Recipient::parse("  42\n");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_EQ(recipient->canonical(), "42");
}

TEST(TypesTest, RecipientParseRejectsEmpty) {
    EXPECT_FALSE(Recipient::parse("").has_value());
    EXPECT_FALSE(Recipient::parse("   ").has_value());
    EXPECT_FALSE(Recipient::parse("@").has_value());
}

TEST(TypesTest, RecipientParseMixedIsHandle) {
    auto recipient = Recipient::parse("123abc");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_TRUE(recipient->is_handle());
    EXPECT_EQ(recipient->canonical(), "@123abc");
}

TEST(TypesTest, RecipientParseOverflowIsNotAnId) {
    auto recipient = Recipient::parse("99999999999999999999");
    ASSERT_TRUE(recipient.has_value());
    EXPECT_FALSE(recipient->is_id());
}

// Test Recipient equality and ordering
TEST(TypesTest, RecipientEqualityByCanonicalForm) {
    EXPECT_EQ(Recipient::from_handle("bob"), Recipient::from_handle("@bob"));
    EXPECT_EQ(*Recipient::parse("@bob"), Recipient::from_handle("bob"));
    EXPECT_EQ(*Recipient::parse("7"), Recipient::from_id(7));
    EXPECT_NE(Recipient::from_id(7), Recipient::from_handle("7"));
}

TEST(TypesTest, RecipientSetDeduplicates) {
    std::set<Recipient> recipients;
    recipients.insert(Recipient::from_id(1));
    recipients.insert(*Recipient::parse("1"));
    recipients.insert(Recipient::from_handle("alice"));
    recipients.insert(*Recipient::parse("@alice"));

    EXPECT_EQ(recipients.size(), 2u);
}

TEST(TypesTest, RecipientOrderIsStable) {
    std::set<Recipient> recipients{
        Recipient::from_handle("zed"),
        Recipient::from_id(200),
        Recipient::from_handle("amy"),
        Recipient::from_id(-5),
    };

    std::vector<std::string> order;
    for (const auto& r : recipients) {
        order.push_back(r.canonical());
    }
    EXPECT_EQ(order, (std::vector<std::string>{"-5", "200", "@amy", "@zed"}));
}

// Test User structure
TEST(TypesTest, UserDisplayName) {
    User user;
    user.id = 123;
    user.username = "johndoe";
    user.first_name = "John";
    user.last_name = "Doe";

    EXPECT_EQ(user.display_name(), "John Doe");
}

TEST(TypesTest, UserDisplayNameFromUsername) {
    User user;
    user.id = 123;
    user.username = "testuser";

    EXPECT_EQ(user.display_name(), "@testuser");
}

TEST(TypesTest, UserDisplayNameFallbackToId) {
    User user;
    user.id = 123;

    EXPECT_EQ(user.display_name(), "User 123");
}

TEST(TypesTest, UserGetIdentifier) {
    User user;
    user.id = 123;
    user.username = "alice";
    user.first_name = "Alice";

    EXPECT_EQ(user.get_identifier(), "@alice");
}

// Test Chat structure
TEST(TypesTest, ChatKinds) {
    Chat chat;
    chat.type = ChatType::PRIVATE;
    EXPECT_TRUE(chat.is_private());

    chat.type = ChatType::SUPERGROUP;
    EXPECT_TRUE(chat.is_group());
    EXPECT_FALSE(chat.is_channel());

    chat.type = ChatType::CHANNEL;
    EXPECT_TRUE(chat.is_channel());
}

TEST(TypesTest, MessageHasMedia) {
    Message msg;
    EXPECT_FALSE(msg.has_media());

    msg.media = MediaType::PHOTO;
    EXPECT_TRUE(msg.has_media());
}

// Test string conversions
TEST(TypesTest, ParseModeFromString) {
    EXPECT_EQ(parse_mode_from_string("html"), ParseMode::HTML);
    EXPECT_EQ(parse_mode_from_string("HTML"), ParseMode::HTML);
    EXPECT_EQ(parse_mode_from_string("MarkdownV2"), ParseMode::MARKDOWN);
    EXPECT_EQ(parse_mode_from_string("none"), ParseMode::NONE);
    EXPECT_EQ(parse_mode_from_string("plain"), ParseMode::NONE);
    EXPECT_FALSE(parse_mode_from_string("rtf").has_value());
}

TEST(TypesTest, ChatTypeToString) {
    EXPECT_EQ(chat_type_to_string(ChatType::PRIVATE), "private");
    EXPECT_EQ(chat_type_to_string(ChatType::CHANNEL), "channel");
}

}  // namespace
}  // namespace tg
