#include "networking/Identity.h"

#include "chat/Member.h"

#include <array>

namespace recallchat::networking {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

int hex_value(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

} // namespace

std::string resolve_identity(const boost::asio::ip::address& remote,
                             std::string_view forwarded_for,
                             bool trust_forwarded) {
    if (trust_forwarded && !forwarded_for.empty()) {
        auto first = trim(forwarded_for.substr(0, forwarded_for.find(',')));
        if (!first.empty()) return std::string(first);
    }

    if (remote.is_v6()) {
        const auto v6 = remote.to_v6();
        if (v6.is_v4_mapped()) {
            return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6).to_string();
        }
    }
    return remote.to_string();
}

std::string_view path_of(std::string_view target) {
    return target.substr(0, target.find('?'));
}

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) return out;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> query_param(std::string_view target, std::string_view key) {
    const auto q = target.find('?');
    if (q == std::string_view::npos) return std::nullopt;

    std::string_view query = target.substr(q + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        const auto eq = pair.find('=');
        std::string_view k = pair.substr(0, eq);
        if (url_decode(k) != key) continue;
        if (eq == std::string_view::npos) return std::string{};
        return url_decode(pair.substr(eq + 1));
    }
    return std::nullopt;
}

std::string room_from_target(std::string_view target) {
    if (auto room = query_param(target, "room")) {
        return chat::Member::normalize_room(*room);
    }

    const std::string_view path = path_of(target);
    static constexpr std::array<std::string_view, 3> prefixes{"/ws/", "/events/", "/poll/"};
    for (auto prefix : prefixes) {
        if (path.substr(0, prefix.size()) == prefix) {
            std::string_view rest = path.substr(prefix.size());
            rest = rest.substr(0, rest.find('/'));
            return chat::Member::normalize_room(url_decode(rest));
        }
    }
    return chat::Member::normalize_room({});
}

} // namespace recallchat::networking
