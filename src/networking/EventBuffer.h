#pragma once

#include "chat/Protocol.h"

#include <boost/json.hpp>

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace recallchat::networking {

struct BufferedEvent {
    std::uint64_t seq = 0;
    boost::json::object payload;
    chat::Audience audience = chat::Audience::All;
    chat::Owner party;
};

struct PollResult {
    boost::json::array events;  // each carries its "seq"
    std::uint64_t next = 0;     // cursor for the following poll
    bool reset = false;         // cursor was ahead of this buffer
};

// Per-room bounded history for pull-based clients. Sequence numbers are
// handed in by the caller and must increase; a buffer created after
// `floor` only ever holds events above it. Not thread-safe; the Dispatcher
// serializes access.
class EventBuffer {
public:
    explicit EventBuffer(std::size_t capacity, std::uint64_t floor = 0);

    void append(std::uint64_t seq, boost::json::object payload, chat::Audience audience, chat::Owner party);

    PollResult since(std::uint64_t cursor,
                     const std::string& identity,
                     const std::string& client_id) const;

    std::uint64_t head() const noexcept { return head_; }
    std::size_t size() const noexcept { return events_.size(); }

private:
    std::size_t capacity_;
    std::uint64_t head_;
    std::deque<BufferedEvent> events_;
};

} // namespace recallchat::networking
