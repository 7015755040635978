#include "networking/EventBuffer.h"

#include <utility>

namespace recallchat::networking {

EventBuffer::EventBuffer(std::size_t capacity, std::uint64_t floor)
    : capacity_(capacity == 0 ? 1 : capacity), head_(floor) {}

void EventBuffer::append(std::uint64_t seq, boost::json::object payload, chat::Audience audience, chat::Owner party) {
    head_ = seq;
    payload["seq"] = seq;
    events_.push_back(BufferedEvent{seq, std::move(payload), audience, std::move(party)});
    while (events_.size() > capacity_) events_.pop_front();
}

PollResult EventBuffer::since(std::uint64_t cursor,
                              const std::string& identity,
                              const std::string& client_id) const {
    PollResult out;
    if (cursor > head()) {
        out.reset = true;
        cursor = 0;
    }

    for (const auto& e : events_) {
        if (e.seq <= cursor) continue;
        if (!chat::audience_includes(e.audience, e.party, identity, client_id)) continue;
        out.events.push_back(e.payload);
    }
    out.next = head();
    return out;
}

} // namespace recallchat::networking
