#pragma once

#include "chat/ArtifactRegistry.h"
#include "chat/Errors.h"
#include "chat/EventSink.h"
#include "chat/IDGenerator.hpp"
#include "chat/Member.h"
#include "chat/RecallEngine.h"
#include "chat/RoomRegistry.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recallchat::chat {

struct UploadRequest {
    std::string room;
    std::string identity;
    std::string client_id;
    std::string name;
    std::string mime_type;
    std::string_view bytes;
    std::int64_t ttl_seconds = 0;
    std::string password;
    bool view_only = false;
};

struct UploadReceipt {
    std::string id;
    std::string room;
    std::optional<std::string> url;  // public reference, if any
    std::string owner_url;
    std::optional<std::int64_t> expires_at;
};

// Everything a transport needs: admission, socket frames, uploads. Holds
// references to the registries built in main; owns none of them.
class Relay {
public:
    Relay(IDGenerator& idgen,
          RoomRegistry& rooms,
          ArtifactRegistry& artifacts,
          RecallEngine& engine,
          EventSink& sink);

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    // Admits the connection, sends it a welcome and broadcasts presence.
    Result<Member> connect(ConnectionId connection,
                           const std::string& identity,
                           const std::string& room,
                           EventSink::Deliver deliver);

    void disconnect(ConnectionId connection);

    // Malformed frames are dropped without a reply.
    void handle_message(ConnectionId connection, std::string_view frame);

    // Only a current member of the room may upload into it.
    Result<UploadReceipt> upload(const UploadRequest& request);

    // Client ids are bearer secrets: one is honoured only while a live member
    // with the same identity holds it. Anything else comes back empty.
    std::string verified_session(const std::string& identity, const std::string& client_id) const;

    bool is_member(const std::string& room, const std::string& identity, const std::string& client_id) const;

private:
    void on_chat(const Member& member, const ChatRequest& req);
    void on_recall(const Member& member, const RecallRequest& req);
    void on_name(const Member& member, const NameRequest& req);

    IDGenerator& idgen_;
    RoomRegistry& rooms_;
    ArtifactRegistry& artifacts_;
    RecallEngine& engine_;
    EventSink& sink_;
};

} // namespace recallchat::chat
