#pragma once

#include "chat/Member.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recallchat::chat {

struct JoinResult {
    bool accepted = false;
    std::vector<Member> members;  // membership after the attempt
};

struct LeaveResult {
    std::string room;
    std::vector<Member> remaining;
    bool room_deleted = false;
};

// Room name -> ordered member list, capacity two.
class RoomRegistry {
public:
    static constexpr std::size_t kCapacity = 2;

    RoomRegistry() = default;
    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Rejected joins never touch the registry.
    JoinResult join(const Member& member);

    std::optional<LeaveResult> leave(ConnectionId connection);

    // Returns the updated member list of the renamed member's room.
    std::optional<std::vector<Member>> rename(ConnectionId connection, std::string name);

    std::vector<Member> members(const std::string& room) const;
    std::optional<Member> find(ConnectionId connection) const;
    std::optional<Member> find_session(const std::string& client_id) const;
    std::size_t room_count() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::vector<Member>> rooms_;
    std::unordered_map<ConnectionId, std::string> room_of_;
};

} // namespace recallchat::chat
