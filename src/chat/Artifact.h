#pragma once

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace recallchat::chat {

using WallClock = std::chrono::system_clock;

enum class ArtifactKind { Chat, File };

enum class RecallTrigger { Manual, Expired, FailedUnlock };

inline const char* to_string(ArtifactKind k) {
    return k == ArtifactKind::Chat ? "chat" : "file";
}

inline const char* to_string(RecallTrigger t) {
    switch (t) {
        case RecallTrigger::Manual:       return "manual";
        case RecallTrigger::Expired:      return "expired";
        case RecallTrigger::FailedUnlock: return "failed_unlock";
    }
    return "manual";
}

inline std::int64_t to_epoch_ms(WallClock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

struct Owner {
    std::string identity;   // network address
    std::string client_id;  // session id at creation time

    // Recall and owner retrieval survive a reconnect that keeps either one.
    bool matches(const std::string& other_identity, const std::string& other_client_id) const {
        if (!identity.empty() && identity == other_identity) return true;
        return !client_id.empty() && client_id == other_client_id;
    }
};

struct Artifact {
    std::string id;
    std::string room;
    ArtifactKind kind = ArtifactKind::Chat;
    Owner owner;
    WallClock::time_point created_at{};
    bool recalled = false;

    std::string text;

    std::string name;
    std::string stored_name;
    std::uint64_t size = 0;
    std::string mime_type;
    // At most one of the two is set.
    std::optional<std::string> public_path;
    std::optional<std::string> restricted_path;

    bool is_protected = false;
    bool view_only = false;
    std::string salt;
    std::string password_hash;
    std::optional<std::string> unlocked_for;

    std::optional<WallClock::time_point> expires_at;
    std::shared_ptr<boost::asio::steady_timer> timer;
};

} // namespace recallchat::chat
