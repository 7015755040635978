#pragma once

#include "chat/EventSink.h"
#include "networking/EventBuffer.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace recallchat::networking {

// Fan-out of one canonical event to three independent sinks: live sockets,
// push streams and the room's poll buffer. publish() is serialized, so every
// transport observes the same per-room order.
//
// Sequence numbers come from one process-wide counter, so a room that closes
// and reopens keeps counting upward and old cursors never skip new events.
// A room's buffer exists only while it has a live socket member.
class Dispatcher : public chat::EventSink {
public:
    using StreamId = std::uint64_t;

    explicit Dispatcher(std::size_t buffer_capacity);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void attach(const chat::Member& member, Deliver deliver) override;
    void detach(chat::ConnectionId connection) override;

    void publish(const std::string& room, const chat::Outbound& out) override;
    void send_direct(chat::ConnectionId connection, const chat::ServerEvent& event) override;
    void close_room(const std::string& room) override;

    // Push streams get broadcast traffic only; owner-targeted events skip them.
    StreamId attach_stream(const std::string& room, const std::string& identity, Deliver deliver);
    void detach_stream(StreamId id);

    PollResult poll(const std::string& room,
                    std::uint64_t since,
                    const std::string& identity,
                    const std::string& client_id) const;

    std::size_t socket_count() const;
    std::size_t stream_count() const;
    std::size_t buffer_count() const;

private:
    struct SocketSink {
        std::string room;
        std::string identity;
        std::string client_id;
        Deliver deliver;
    };

    struct StreamSink {
        std::string room;
        std::string identity;
        Deliver deliver;
    };

    static void deliver_safely(const Deliver& deliver, const std::string& payload, const char* what);
    bool has_socket_in(const std::string& room) const;

    std::size_t buffer_capacity_;

    mutable std::mutex mu_;
    std::unordered_map<chat::ConnectionId, SocketSink> sockets_;
    std::unordered_map<StreamId, StreamSink> streams_;
    std::unordered_map<std::string, EventBuffer> buffers_;
    StreamId next_stream_id_ = 1;
    std::uint64_t last_seq_ = 0;
};

} // namespace recallchat::networking
