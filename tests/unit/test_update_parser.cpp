#include <gtest/gtest.h>
#include "telegram/update_parser.hpp"

using namespace surge::telegram;

TEST(UpdateParserTest, ParsesTextMessages) {
    auto result = UpdateParser::parse_updates(R"({
        "ok": true,
        "result": [
            {"update_id": 100, "message": {"message_id": 1, "chat": {"id": 123456789, "type": "private"}, "text": "/status"}},
            {"update_id": 101, "message": {"message_id": 2, "chat": {"id": -100200300}, "text": "/z 3.5"}}
        ]
    })");

    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& updates = result.value();
    ASSERT_EQ(updates.size(), 2u);

    EXPECT_EQ(updates[0].update_id, 100);
    EXPECT_EQ(updates[0].chat_id, "123456789");
    EXPECT_EQ(updates[0].text, "/status");
    EXPECT_EQ(updates[1].chat_id, "-100200300");
    EXPECT_EQ(updates[1].text, "/z 3.5");
}

TEST(UpdateParserTest, KeepsUpdatesWithoutText) {
    auto result = UpdateParser::parse_updates(R"({
        "ok": true,
        "result": [
            {"update_id": 7, "message": {"chat": {"id": 1}, "sticker": {}}},
            {"update_id": 8, "edited_message": {"chat": {"id": 1}, "text": "x"}}
        ]
    })");

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_TRUE(result.value()[0].text.empty());
    EXPECT_TRUE(result.value()[1].text.empty());
    EXPECT_EQ(result.value()[1].update_id, 8);
}

TEST(UpdateParserTest, EmptyResult) {
    auto result = UpdateParser::parse_updates(R"({"ok": true, "result": []})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST(UpdateParserTest, SkipsEntriesWithoutUpdateId) {
    auto result = UpdateParser::parse_updates(
        R"({"ok": true, "result": [{"message": {"text": "/status"}}, {"update_id": 3}]})");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].update_id, 3);
}

TEST(UpdateParserTest, ApiErrorReportsDescription) {
    auto result = UpdateParser::parse_updates(
        R"({"ok": false, "error_code": 401, "description": "Unauthorized"})");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "Unauthorized");
}

TEST(UpdateParserTest, InvalidJson) {
    EXPECT_TRUE(UpdateParser::parse_updates("<html>").is_err());
    EXPECT_TRUE(UpdateParser::parse_updates("42").is_err());
}

TEST(UpdateParserTest, SendResult) {
    EXPECT_TRUE(UpdateParser::parse_send_result(R"({"ok": true, "result": {}})").is_ok());

    auto rejected = UpdateParser::parse_send_result(
        R"({"ok": false, "description": "Bad Request: chat not found"})");
    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error(), "Bad Request: chat not found");

    EXPECT_TRUE(UpdateParser::parse_send_result("garbage").is_err());
}
