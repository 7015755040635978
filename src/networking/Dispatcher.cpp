#include "networking/Dispatcher.h"

#include <exception>
#include <iostream>
#include <utility>

namespace recallchat::networking {

namespace json = boost::json;

Dispatcher::Dispatcher(std::size_t buffer_capacity)
    : buffer_capacity_(buffer_capacity) {}

void Dispatcher::attach(const chat::Member& member, Deliver deliver) {
    std::lock_guard<std::mutex> lk(mu_);
    sockets_[member.connection()] =
        SocketSink{member.room(), member.identity(), member.client_id(), std::move(deliver)};
}

void Dispatcher::detach(chat::ConnectionId connection) {
    std::lock_guard<std::mutex> lk(mu_);
    sockets_.erase(connection);
}

void Dispatcher::deliver_safely(const Deliver& deliver, const std::string& payload, const char* what) {
    if (!deliver) return;
    try {
        deliver(payload);
    } catch (const std::exception& e) {
        // A broken sink must not stop delivery to the others.
        std::cerr << "[Dispatcher] " << what << " sink failed: " << e.what() << "\n";
    }
}

bool Dispatcher::has_socket_in(const std::string& room) const {
    for (const auto& [id, sink] : sockets_) {
        if (sink.room == room) return true;
    }
    return false;
}

void Dispatcher::publish(const std::string& room, const chat::Outbound& out) {
    json::object payload = chat::to_json(out.event);

    std::lock_guard<std::mutex> lk(mu_);

    const std::uint64_t seq = ++last_seq_;
    payload["seq"] = seq;

    auto it = buffers_.find(room);
    if (it == buffers_.end() && has_socket_in(room)) {
        it = buffers_.emplace(room, EventBuffer(buffer_capacity_, seq - 1)).first;
    }
    if (it != buffers_.end()) it->second.append(seq, payload, out.audience, out.party);

    const std::string text = json::serialize(payload);

    for (const auto& [id, sink] : sockets_) {
        if (sink.room != room) continue;
        if (!out.visible_to(sink.identity, sink.client_id)) continue;
        deliver_safely(sink.deliver, text, "socket");
    }

    if (out.audience == chat::Audience::Owner) return;
    for (const auto& [id, sink] : streams_) {
        if (sink.room != room) continue;
        deliver_safely(sink.deliver, text, "stream");
    }
}

void Dispatcher::send_direct(chat::ConnectionId connection, const chat::ServerEvent& event) {
    const std::string text = chat::serialize(event);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = sockets_.find(connection);
    if (it == sockets_.end()) return;
    deliver_safely(it->second.deliver, text, "socket");
}

void Dispatcher::close_room(const std::string& room) {
    std::lock_guard<std::mutex> lk(mu_);
    buffers_.erase(room);
}

Dispatcher::StreamId Dispatcher::attach_stream(const std::string& room,
                                               const std::string& identity,
                                               Deliver deliver) {
    std::lock_guard<std::mutex> lk(mu_);
    const StreamId id = next_stream_id_++;
    streams_[id] = StreamSink{room, identity, std::move(deliver)};
    return id;
}

void Dispatcher::detach_stream(StreamId id) {
    std::lock_guard<std::mutex> lk(mu_);
    streams_.erase(id);
}

PollResult Dispatcher::poll(const std::string& room,
                            std::uint64_t since,
                            const std::string& identity,
                            const std::string& client_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = buffers_.find(room);
    if (it == buffers_.end()) {
        PollResult empty;
        empty.reset = since > 0;
        return empty;
    }
    return it->second.since(since, identity, client_id);
}

std::size_t Dispatcher::socket_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sockets_.size();
}

std::size_t Dispatcher::stream_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return streams_.size();
}

std::size_t Dispatcher::buffer_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return buffers_.size();
}

} // namespace recallchat::networking
