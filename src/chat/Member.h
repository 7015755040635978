#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace recallchat::chat {

using ConnectionId = std::uint64_t;

// One live socket connection admitted into a room.
class Member {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kMaxNameLen = 24;
    static constexpr std::size_t kMaxRoomLen = 64;
    static constexpr const char* kDefaultRoom = "lobby";

    Member(ConnectionId connection,
           std::string client_id,
           std::string identity,
           std::string room);

    ConnectionId connection() const noexcept;
    const std::string& client_id() const noexcept;
    const std::string& identity() const noexcept;
    const std::string& room() const noexcept;
    const std::string& name() const noexcept;

    void set_name(std::string new_name);

    Clock::time_point connected_at() const noexcept;

    // Trims, keeps [A-Za-z0-9._-], caps the length; empty becomes kDefaultRoom.
    static std::string normalize_room(std::string s);
    static std::string sanitize_name(std::string s);

private:
    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;

    ConnectionId connection_;
    std::string client_id_;
    std::string identity_;
    std::string room_;
    std::string name_;
    Clock::time_point connected_at_;
};

} // namespace recallchat::chat
