#pragma once

#include <boost/asio/ip/address.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace recallchat::networking {

// Network-address identity of a request. With trust_forwarded the first
// X-Forwarded-For hop wins (for deployments behind a reverse proxy).
std::string resolve_identity(const boost::asio::ip::address& remote,
                             std::string_view forwarded_for,
                             bool trust_forwarded);

// "room" query parameter, else the segment after /ws/, /events/ or /poll/.
// Always normalized; empty becomes the default room.
std::string room_from_target(std::string_view target);

std::string_view path_of(std::string_view target);
std::optional<std::string> query_param(std::string_view target, std::string_view key);
std::string url_decode(std::string_view s);

} // namespace recallchat::networking
