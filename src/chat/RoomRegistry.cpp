#include "chat/RoomRegistry.h"

#include <algorithm>
#include <utility>

namespace recallchat::chat {

JoinResult RoomRegistry::join(const Member& member) {
    std::lock_guard<std::mutex> lk(mu_);

    if (room_of_.count(member.connection())) {
        // Already admitted; report the current state of its room.
        return JoinResult{true, rooms_[room_of_[member.connection()]]};
    }

    auto it = rooms_.find(member.room());
    if (it != rooms_.end() && it->second.size() >= kCapacity) {
        return JoinResult{false, it->second};
    }

    auto& list = rooms_[member.room()];
    list.push_back(member);
    room_of_[member.connection()] = member.room();
    return JoinResult{true, list};
}

std::optional<LeaveResult> RoomRegistry::leave(ConnectionId connection) {
    std::lock_guard<std::mutex> lk(mu_);

    auto rit = room_of_.find(connection);
    if (rit == room_of_.end()) return std::nullopt;

    LeaveResult out;
    out.room = rit->second;
    room_of_.erase(rit);

    auto it = rooms_.find(out.room);
    if (it != rooms_.end()) {
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const Member& m) { return m.connection() == connection; }),
                   list.end());
        if (list.empty()) {
            rooms_.erase(it);
            out.room_deleted = true;
        } else {
            out.remaining = list;
        }
    } else {
        out.room_deleted = true;
    }
    return out;
}

std::optional<std::vector<Member>> RoomRegistry::rename(ConnectionId connection, std::string name) {
    std::lock_guard<std::mutex> lk(mu_);

    auto rit = room_of_.find(connection);
    if (rit == room_of_.end()) return std::nullopt;

    auto& list = rooms_[rit->second];
    for (auto& m : list) {
        if (m.connection() == connection) m.set_name(std::move(name));
    }
    return list;
}

std::vector<Member> RoomRegistry::members(const std::string& room) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return {};
    return it->second;
}

std::optional<Member> RoomRegistry::find(ConnectionId connection) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto rit = room_of_.find(connection);
    if (rit == room_of_.end()) return std::nullopt;

    auto it = rooms_.find(rit->second);
    if (it == rooms_.end()) return std::nullopt;
    for (const auto& m : it->second) {
        if (m.connection() == connection) return m;
    }
    return std::nullopt;
}

std::optional<Member> RoomRegistry::find_session(const std::string& client_id) const {
    if (client_id.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [room, list] : rooms_) {
        for (const auto& m : list) {
            if (m.client_id() == client_id) return m;
        }
    }
    return std::nullopt;
}

std::size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.size();
}

} // namespace recallchat::chat
