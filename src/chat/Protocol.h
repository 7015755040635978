#pragma once

#include "chat/Artifact.h"
#include "chat/Errors.h"
#include "chat/Member.h"

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace recallchat::chat {

// ---- client -> server (live socket frames) ----

struct ChatRequest   { std::string text; };
struct RecallRequest { std::string id; };
struct NameRequest   { std::string name; };

using ClientMessage = std::variant<ChatRequest, RecallRequest, NameRequest>;

// Anything that is not a well-formed known frame yields nullopt.
std::optional<ClientMessage> parse_client_message(std::string_view frame);

// ---- server -> client ----

// Session ids stay with their own session; peers only see identities.
struct MemberView {
    std::string identity;
    std::string name;
};

struct Welcome {
    std::string client_id;
    std::string identity;
    std::string room;
    std::vector<MemberView> members;
};

struct Presence {
    std::string room;
    std::vector<MemberView> members;
};

struct ChatPosted {
    std::string id;
    std::string from;
    std::string name;
    std::string text;
    std::int64_t timestamp = 0;
};

struct FileAvailable {
    std::string id;
    std::string from;
    std::string name;
    std::uint64_t size = 0;
    std::string mime;
    bool is_protected = false;
    bool view_only = false;
    std::optional<std::int64_t> expires_at;
    std::optional<std::string> url;  // public reference, when there is one
    std::int64_t timestamp = 0;
};

struct Recalled {
    std::string id;
    ArtifactKind kind = ArtifactKind::Chat;
    RecallTrigger trigger = RecallTrigger::Manual;
};

struct RecallConfirmed {
    std::string id;
    ArtifactKind kind = ArtifactKind::Chat;
    RecallTrigger trigger = RecallTrigger::Manual;
    std::optional<std::string> owner_url;
};

struct Unlocked {
    std::string id;
    std::string by;
    std::string url;
};

struct Downloaded {
    std::string id;
    std::string by;
    std::int64_t at = 0;
};

struct Failure {
    ErrorCategory category = ErrorCategory::InvalidInput;
    std::string message;
    std::string id;
};

using ServerEvent = std::variant<Welcome, Presence, ChatPosted, FileAvailable,
                                 Recalled, RecallConfirmed, Unlocked, Downloaded, Failure>;

boost::json::object to_json(const ServerEvent& event);
std::string serialize(const ServerEvent& event);

std::vector<MemberView> member_views(const std::vector<Member>& members);

// ---- delivery envelope ----

enum class Audience { All, Owner, NonOwner };

inline bool audience_includes(Audience audience, const Owner& party,
                              const std::string& identity, const std::string& client_id) {
    switch (audience) {
        case Audience::All:      return true;
        case Audience::Owner:    return party.matches(identity, client_id);
        case Audience::NonOwner: return !party.matches(identity, client_id);
    }
    return false;
}

struct Outbound {
    ServerEvent event;
    Audience audience = Audience::All;
    Owner party;  // compared against recipients unless audience is All

    bool visible_to(const std::string& identity, const std::string& client_id) const {
        return audience_includes(audience, party, identity, client_id);
    }
};

// URLs handed out to clients.
std::string public_url(const std::string& id);
std::string owner_url(const std::string& id);
std::string peer_url(const std::string& id);

} // namespace recallchat::chat
