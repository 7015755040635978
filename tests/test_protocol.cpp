#include <gtest/gtest.h>

#include "chat/Protocol.h"

#include <boost/json.hpp>

using namespace recallchat::chat;
namespace json = boost::json;

TEST(ProtocolTest, parses_known_frames) {
    auto chat = parse_client_message(R"({"kind":"chat","text":"hi"})");
    ASSERT_TRUE(chat.has_value());
    ASSERT_TRUE(std::holds_alternative<ChatRequest>(*chat));
    EXPECT_EQ(std::get<ChatRequest>(*chat).text, "hi");

    auto recall = parse_client_message(R"({"kind":"recall","id":"item-1"})");
    ASSERT_TRUE(recall.has_value());
    EXPECT_EQ(std::get<RecallRequest>(*recall).id, "item-1");

    auto name = parse_client_message(R"({"kind":"name","name":"ann"})");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(std::get<NameRequest>(*name).name, "ann");
}

TEST(ProtocolTest, malformed_frames_are_rejected) {
    EXPECT_FALSE(parse_client_message("not json").has_value());
    EXPECT_FALSE(parse_client_message("[1,2,3]").has_value());
    EXPECT_FALSE(parse_client_message(R"({"text":"no kind"})").has_value());
    EXPECT_FALSE(parse_client_message(R"({"kind":"shout","text":"x"})").has_value());
    EXPECT_FALSE(parse_client_message(R"({"kind":"chat","text":42})").has_value());
    EXPECT_FALSE(parse_client_message(R"({"kind":"recall","id":""})").has_value());
    EXPECT_FALSE(parse_client_message(R"({"kind":"recall"})").has_value());
}

TEST(ProtocolTest, chat_event_carries_sender_and_text) {
    auto obj = to_json(ChatPosted{"item-1", "10.0.0.1", "ann", "hi", 1700000000000});
    EXPECT_EQ(obj.at("kind").as_string(), "chat");
    EXPECT_EQ(obj.at("id").as_string(), "item-1");
    EXPECT_EQ(obj.at("from").as_string(), "10.0.0.1");
    EXPECT_FALSE(obj.contains("fromClient"));
    EXPECT_EQ(obj.at("text").as_string(), "hi");
    EXPECT_EQ(obj.at("timestamp").as_int64(), 1700000000000);
}

TEST(ProtocolTest, file_event_omits_values_it_does_not_have) {
    FileAvailable f;
    f.id = "item-2";
    f.name = "doc.txt";
    f.size = 7;
    f.is_protected = true;

    auto obj = to_json(f);
    EXPECT_EQ(obj.at("kind").as_string(), "file");
    EXPECT_TRUE(obj.at("protected").as_bool());
    EXPECT_FALSE(obj.at("viewOnly").as_bool());
    EXPECT_TRUE(obj.at("url").is_null());
    EXPECT_TRUE(obj.at("expiresAt").is_null());

    f.url = public_url("item-2");
    f.expires_at = 42;
    obj = to_json(f);
    EXPECT_EQ(obj.at("url").as_string(), "/files/public/item-2");
    EXPECT_EQ(obj.at("expiresAt").as_int64(), 42);
}

TEST(ProtocolTest, recall_events_name_their_reason) {
    auto peer = to_json(Recalled{"item-3", ArtifactKind::File, RecallTrigger::FailedUnlock});
    EXPECT_EQ(peer.at("kind").as_string(), "recalled");
    EXPECT_EQ(peer.at("itemKind").as_string(), "file");
    EXPECT_EQ(peer.at("reason").as_string(), "failed_unlock");
    EXPECT_FALSE(peer.contains("ownerUrl"));

    auto ack = to_json(RecallConfirmed{"item-3", ArtifactKind::File, RecallTrigger::Expired, owner_url("item-3")});
    EXPECT_EQ(ack.at("kind").as_string(), "recall_ack");
    EXPECT_EQ(ack.at("reason").as_string(), "expired");
    EXPECT_EQ(ack.at("ownerUrl").as_string(), "/files/owner/item-3");
}

TEST(ProtocolTest, failure_event_carries_category) {
    auto obj = to_json(Failure{ErrorCategory::Forbidden, "only the sender can recall", "item-4"});
    EXPECT_EQ(obj.at("kind").as_string(), "error");
    EXPECT_EQ(obj.at("error").as_string(), "forbidden");
    EXPECT_EQ(obj.at("id").as_string(), "item-4");

    auto bare = to_json(Failure{ErrorCategory::RoomFull, "room is full", ""});
    EXPECT_EQ(bare.at("error").as_string(), "room_full");
    EXPECT_FALSE(bare.contains("id"));
}

TEST(ProtocolTest, serialize_produces_parseable_text) {
    Welcome w{"client-1", "10.0.0.1", "alpha",
              {MemberView{"10.0.0.1", "guest"}, MemberView{"10.0.0.2", "bob"}}};
    json::value v = json::parse(serialize(w));
    const auto& obj = v.as_object();
    EXPECT_EQ(obj.at("kind").as_string(), "welcome");
    EXPECT_EQ(obj.at("room").as_string(), "alpha");
    EXPECT_EQ(obj.at("clientId").as_string(), "client-1");
    ASSERT_EQ(obj.at("members").as_array().size(), 2u);
    const auto& peer = obj.at("members").as_array()[1].as_object();
    EXPECT_EQ(peer.at("identity").as_string(), "10.0.0.2");
    EXPECT_FALSE(peer.contains("clientId"));
}

TEST(ProtocolTest, peer_events_never_expose_session_ids) {
    Member a{1, "client-a", "10.0.0.1", "alpha"};
    Member b{2, "client-b", "10.0.0.2", "alpha"};
    const std::string text = serialize(Presence{"alpha", member_views({a, b})});
    EXPECT_EQ(text.find("client-a"), std::string::npos);
    EXPECT_EQ(text.find("client-b"), std::string::npos);

    FileAvailable f;
    f.id = "item-6";
    f.from = "10.0.0.1";
    EXPECT_FALSE(to_json(f).contains("fromClient"));
}

TEST(ProtocolTest, audience_filters_by_owner_identity_or_client) {
    Owner alice{"10.0.0.1", "client-a"};
    Outbound to_owner{Recalled{"item-5"}, Audience::Owner, alice};
    Outbound to_peer{Recalled{"item-5"}, Audience::NonOwner, alice};
    Outbound to_all{Recalled{"item-5"}};

    EXPECT_TRUE(to_owner.visible_to("10.0.0.1", "client-x"));
    EXPECT_TRUE(to_owner.visible_to("10.9.9.9", "client-a"));
    EXPECT_FALSE(to_owner.visible_to("10.0.0.2", "client-b"));

    EXPECT_FALSE(to_peer.visible_to("10.0.0.1", "client-a"));
    EXPECT_TRUE(to_peer.visible_to("10.0.0.2", "client-b"));

    EXPECT_TRUE(to_all.visible_to("10.0.0.1", "client-a"));
    EXPECT_TRUE(to_all.visible_to("10.0.0.2", "client-b"));
}
