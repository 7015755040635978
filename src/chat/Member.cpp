#include "chat/Member.h"

#include <utility>

namespace recallchat::chat {

Member::Member(ConnectionId connection, std::string client_id, std::string identity, std::string room)
    : connection_(connection),
      client_id_(std::move(client_id)),
      identity_(std::move(identity)),
      room_(normalize_room(std::move(room))),
      name_(sanitize_name({})),
      connected_at_(Clock::now()) {}

ConnectionId Member::connection() const noexcept { return connection_; }
const std::string& Member::client_id() const noexcept { return client_id_; }
const std::string& Member::identity() const noexcept { return identity_; }
const std::string& Member::room() const noexcept { return room_; }
const std::string& Member::name() const noexcept { return name_; }

void Member::set_name(std::string new_name) {
    name_ = sanitize_name(std::move(new_name));
}

Member::Clock::time_point Member::connected_at() const noexcept { return connected_at_; }

bool Member::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string Member::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

std::string Member::sanitize_name(std::string s) {
    s = trim_copy(std::move(s));

    if (s.size() > kMaxNameLen) {
        s.resize(kMaxNameLen);
        s = trim_copy(std::move(s));
    }

    if (s.empty()) s = "guest";
    return s;
}

std::string Member::normalize_room(std::string s) {
    s = trim_copy(std::move(s));

    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (keep) out.push_back(c);
        if (out.size() == kMaxRoomLen) break;
    }

    if (out.empty()) out = kDefaultRoom;
    return out;
}

} // namespace recallchat::chat
