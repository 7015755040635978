#pragma once

#include "chat/Member.h"
#include "chat/Protocol.h"

#include <functional>
#include <string>

namespace recallchat::chat {

// Where the chat layer hands its events. The networking Dispatcher is the
// production implementation; tests record into a vector.
class EventSink {
public:
    using Deliver = std::function<void(const std::string&)>;

    virtual ~EventSink() = default;

    // Registers a live socket member; deliver must not block.
    virtual void attach(const Member& member, Deliver deliver) = 0;
    virtual void detach(ConnectionId connection) = 0;

    virtual void publish(const std::string& room, const Outbound& out) = 0;

    // One connection only; not buffered for polling.
    virtual void send_direct(ConnectionId connection, const ServerEvent& event) = 0;

    // Last member left: drop room-scoped delivery state.
    virtual void close_room(const std::string& room) = 0;
};

} // namespace recallchat::chat
