#include <gtest/gtest.h>

#include "TestSupport.h"
#include "chat/ArtifactRegistry.h"

#include <filesystem>

using namespace recallchat::chat;
using recallchat::testing::TempDir;

class ArtifactRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { storage.prepare(); }

    TempDir dir;
    StorageMover storage{dir.path()};
    IDGenerator idgen;
    ArtifactRegistry registry{idgen, storage};
    Owner alice{"10.0.0.1", "client-a"};
};

TEST_F(ArtifactRegistryTest, chat_text_is_truncated_to_bound) {
    auto a = registry.create_chat("alpha", alice, std::string(4100, 'x'));
    EXPECT_EQ(a.text.size(), ArtifactRegistry::kMaxTextUnits);
    EXPECT_FALSE(a.recalled);
    EXPECT_EQ(a.kind, ArtifactKind::Chat);
}

TEST_F(ArtifactRegistryTest, truncation_counts_utf16_units_not_bytes) {
    std::string text;
    for (int i = 0; i < 10; ++i) text += "\xC3\xA9";  // é
    const std::string cut = ArtifactRegistry::truncate_text(text, 4);
    EXPECT_EQ(cut, "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9");
    EXPECT_EQ(ArtifactRegistry::truncate_text("short", 4000), "short");
}

TEST_F(ArtifactRegistryTest, astral_characters_count_twice) {
    const std::string smile = "\xF0\x9F\x98\x80";  // U+1F600
    std::string text;
    for (int i = 0; i < 3000; ++i) text += smile;

    auto a = registry.create_chat("alpha", alice, text);
    EXPECT_EQ(a.text.size(), 2000u * smile.size());

    // A pair never straddles the limit.
    EXPECT_EQ(ArtifactRegistry::truncate_text("a" + smile, 2), "a");
    EXPECT_EQ(ArtifactRegistry::truncate_text("a" + smile, 3), "a" + smile);
}

TEST_F(ArtifactRegistryTest, ids_are_unique) {
    auto a = registry.create_chat("alpha", alice, "one");
    auto b = registry.create_chat("alpha", alice, "two");
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(ArtifactRegistryTest, plain_file_is_public) {
    auto r = registry.create_file("alpha", alice, FileUpload{"notes.txt", "text/plain", "hello"}, 0, "", false);
    ASSERT_TRUE(ok(r));
    const auto& a = std::get<Artifact>(r);

    ASSERT_TRUE(a.public_path.has_value());
    EXPECT_FALSE(a.restricted_path.has_value());
    EXPECT_FALSE(a.is_protected);
    EXPECT_FALSE(a.expires_at.has_value());
    EXPECT_EQ(a.size, 5u);
    EXPECT_EQ(std::filesystem::path(*a.public_path).parent_path(), storage.public_dir());
    EXPECT_EQ(recallchat::testing::read_file(*a.public_path), "hello");
}

TEST_F(ArtifactRegistryTest, protected_file_starts_in_vault_with_salted_hash) {
    auto r = registry.create_file("alpha", alice, FileUpload{"secret.pdf", "", "bytes"}, 0, "hunter2", false);
    ASSERT_TRUE(ok(r));
    const auto& a = std::get<Artifact>(r);

    EXPECT_TRUE(a.is_protected);
    EXPECT_FALSE(a.public_path.has_value());
    ASSERT_TRUE(a.restricted_path.has_value());
    EXPECT_EQ(std::filesystem::path(*a.restricted_path).parent_path(), storage.vault_dir());
    EXPECT_TRUE(std::filesystem::is_empty(storage.public_dir()));

    EXPECT_FALSE(a.salt.empty());
    EXPECT_FALSE(a.password_hash.empty());
    EXPECT_EQ(a.password_hash.find("hunter2"), std::string::npos);
    EXPECT_EQ(a.mime_type, "application/octet-stream");
}

TEST_F(ArtifactRegistryTest, view_only_file_starts_in_vault) {
    auto r = registry.create_file("alpha", alice, FileUpload{"pic.png", "image/png", "png"}, 0, "", true);
    ASSERT_TRUE(ok(r));
    const auto& a = std::get<Artifact>(r);
    EXPECT_TRUE(a.view_only);
    EXPECT_FALSE(a.is_protected);
    EXPECT_FALSE(a.public_path.has_value());
    EXPECT_TRUE(a.restricted_path.has_value());
}

TEST_F(ArtifactRegistryTest, ttl_is_clamped) {
    EXPECT_EQ(ArtifactRegistry::clamp_ttl(-10), 0);
    EXPECT_EQ(ArtifactRegistry::clamp_ttl(60), 60);
    EXPECT_EQ(ArtifactRegistry::clamp_ttl(1LL << 40), ArtifactRegistry::kMaxTtlSeconds);

    auto r = registry.create_file("alpha", alice, FileUpload{"a.txt", "text/plain", "x"}, 1LL << 40, "", false);
    ASSERT_TRUE(ok(r));
    const auto& a = std::get<Artifact>(r);
    ASSERT_TRUE(a.expires_at.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(*a.expires_at - a.created_at).count(),
              ArtifactRegistry::kMaxTtlSeconds);
}

TEST_F(ArtifactRegistryTest, concurrent_uploads_of_same_name_are_independent) {
    auto r1 = registry.create_file("alpha", alice, FileUpload{"same.txt", "text/plain", "one"}, 0, "", false);
    auto r2 = registry.create_file("alpha", alice, FileUpload{"same.txt", "text/plain", "two"}, 0, "", false);
    ASSERT_TRUE(ok(r1));
    ASSERT_TRUE(ok(r2));
    const auto& a = std::get<Artifact>(r1);
    const auto& b = std::get<Artifact>(r2);
    EXPECT_NE(a.id, b.id);
    EXPECT_NE(*a.public_path, *b.public_path);
    EXPECT_EQ(recallchat::testing::read_file(*a.public_path), "one");
    EXPECT_EQ(recallchat::testing::read_file(*b.public_path), "two");
}

TEST_F(ArtifactRegistryTest, storage_failure_is_reported) {
    std::filesystem::remove_all(storage.public_dir());
    auto r = registry.create_file("alpha", alice, FileUpload{"a.txt", "text/plain", "x"}, 0, "", false);
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).category, ErrorCategory::Storage);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ArtifactRegistryTest, authorize_recall_matches_identity_or_client) {
    auto a = registry.create_chat("alpha", alice, "hi");

    EXPECT_TRUE(registry.authorize_recall(a.id, "10.0.0.1", "client-other"));
    EXPECT_TRUE(registry.authorize_recall(a.id, "10.9.9.9", "client-a"));
    EXPECT_FALSE(registry.authorize_recall(a.id, "10.0.0.2", "client-b"));
    EXPECT_FALSE(registry.authorize_recall(a.id, "10.0.0.2", ""));
    EXPECT_FALSE(registry.authorize_recall("item-missing", "10.0.0.1", "client-a"));
}

TEST_F(ArtifactRegistryTest, observer_sees_inserted_record) {
    std::string seen;
    auto a = registry.create_chat("alpha", alice, "hi", [&](const Artifact& rec) { seen = rec.id; });
    EXPECT_EQ(seen, a.id);
    EXPECT_FALSE(registry.get("item-missing").has_value());
    ASSERT_TRUE(registry.get(a.id).has_value());
    EXPECT_EQ(registry.get(a.id)->text, "hi");
}
