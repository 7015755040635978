#include <gtest/gtest.h>

#include "TestSupport.h"
#include "chat/RecallEngine.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace recallchat::chat;
using recallchat::testing::RecordingSink;
using recallchat::testing::TempDir;

class RecallEngineTest : public ::testing::Test {
protected:
    void SetUp() override { storage.prepare(); }

    Artifact upload(const std::string& bytes, std::int64_t ttl = 0) {
        auto r = artifacts.create_file("alpha", alice, FileUpload{"doc.txt", "text/plain", bytes}, ttl, "", false);
        return std::get<Artifact>(r);
    }

    TempDir dir;
    StorageMover storage{dir.path()};
    IDGenerator idgen;
    ArtifactRegistry artifacts{idgen, storage};
    RecordingSink sink;
    boost::asio::io_context ioc;
    RecallEngine engine{ioc, artifacts, storage, sink};
    Owner alice{"10.0.0.1", "client-a"};
};

TEST_F(RecallEngineTest, manual_recall_moves_file_and_notifies_both_sides) {
    Artifact a = upload("data");
    const std::string public_path = *a.public_path;

    EXPECT_EQ(engine.recall_by(a.id, "10.0.0.1", "client-a"), RecallStatus::Recalled);

    auto rec = artifacts.get(a.id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->recalled);
    EXPECT_FALSE(rec->public_path.has_value());
    ASSERT_TRUE(rec->restricted_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(public_path));

    auto peers = sink.published_of<Recalled>();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].room, "alpha");
    EXPECT_EQ(peers[0].out.audience, Audience::NonOwner);
    EXPECT_EQ(std::get<Recalled>(peers[0].out.event).trigger, RecallTrigger::Manual);

    auto acks = sink.published_of<RecallConfirmed>();
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks[0].out.audience, Audience::Owner);
    const auto& ack = std::get<RecallConfirmed>(acks[0].out.event);
    ASSERT_TRUE(ack.owner_url.has_value());
    EXPECT_EQ(*ack.owner_url, owner_url(a.id));
}

TEST_F(RecallEngineTest, recall_is_idempotent) {
    Artifact a = upload("data");

    EXPECT_EQ(engine.recall(a.id, RecallTrigger::Manual), RecallStatus::Recalled);
    EXPECT_EQ(engine.recall(a.id, RecallTrigger::Expired), RecallStatus::AlreadyRecalled);
    EXPECT_EQ(engine.recall(a.id, RecallTrigger::FailedUnlock), RecallStatus::AlreadyRecalled);

    EXPECT_EQ(sink.events_of<Recalled>().size(), 1u);
    EXPECT_EQ(sink.events_of<RecallConfirmed>().size(), 1u);
}

TEST_F(RecallEngineTest, racing_recalls_produce_one_transition) {
    Artifact a = upload("data");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] { engine.recall(a.id, RecallTrigger::Manual); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(sink.events_of<Recalled>().size(), 1u);
    EXPECT_EQ(sink.events_of<RecallConfirmed>().size(), 1u);
}

TEST_F(RecallEngineTest, non_owner_cannot_recall) {
    Artifact a = upload("data");

    EXPECT_EQ(engine.recall_by(a.id, "10.0.0.2", "client-b"), RecallStatus::Forbidden);
    EXPECT_FALSE(artifacts.get(a.id)->recalled);
    EXPECT_TRUE(sink.published.empty());

    EXPECT_EQ(engine.recall_by("item-missing", "10.0.0.1", "client-a"), RecallStatus::NotFound);
}

TEST_F(RecallEngineTest, chat_recall_has_no_owner_url) {
    Artifact c = artifacts.create_chat("alpha", alice, "oops");
    EXPECT_EQ(engine.recall_by(c.id, "10.0.0.1", "client-a"), RecallStatus::Recalled);

    auto acks = sink.events_of<RecallConfirmed>();
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks[0].kind, ArtifactKind::Chat);
    EXPECT_FALSE(acks[0].owner_url.has_value());
}

TEST_F(RecallEngineTest, ttl_expiry_recalls_after_deadline) {
    Artifact a = upload("data", 1);
    ASSERT_TRUE(a.expires_at.has_value());
    engine.arm(a.id);

    ioc.run_for(std::chrono::milliseconds(1500));

    auto rec = artifacts.get(a.id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->recalled);
    EXPECT_GE(WallClock::now(), *a.expires_at);

    auto peers = sink.events_of<Recalled>();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].trigger, RecallTrigger::Expired);
}

TEST_F(RecallEngineTest, manual_recall_cancels_pending_timer) {
    Artifact a = upload("data", 1);
    engine.arm(a.id);
    ASSERT_EQ(engine.recall_by(a.id, "10.0.0.1", "client-a"), RecallStatus::Recalled);

    ioc.run_for(std::chrono::milliseconds(1500));

    auto peers = sink.events_of<Recalled>();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].trigger, RecallTrigger::Manual);
}

TEST_F(RecallEngineTest, arm_ignores_items_without_expiry) {
    Artifact a = upload("data", 0);
    engine.arm(a.id);
    EXPECT_EQ(artifacts.get(a.id)->timer, nullptr);
    EXPECT_EQ(ioc.run_for(std::chrono::milliseconds(10)), 0u);
}
