#include "chat/Protocol.h"

#include <type_traits>

namespace recallchat::chat {

namespace json = boost::json;

namespace {

const json::string* string_field(const json::object& obj, std::string_view key) {
    auto* v = obj.if_contains(key);
    if (!v) return nullptr;
    return v->if_string();
}

json::array members_to_json(const std::vector<MemberView>& members) {
    json::array arr;
    for (const auto& m : members) {
        arr.push_back(json::object{
            {"identity", m.identity},
            {"name", m.name},
        });
    }
    return arr;
}

template <typename T>
json::value optional_to_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return json::value_from(*v);
}

} // namespace

std::optional<ClientMessage> parse_client_message(std::string_view frame) {
    json::error_code ec;
    json::value v = json::parse(frame, ec);
    if (ec) return std::nullopt;

    auto* obj = v.if_object();
    if (!obj) return std::nullopt;

    auto* kind = string_field(*obj, "kind");
    if (!kind) return std::nullopt;

    if (*kind == "chat") {
        auto* text = string_field(*obj, "text");
        if (!text) return std::nullopt;
        return ClientMessage{ChatRequest{std::string(*text)}};
    }
    if (*kind == "recall") {
        auto* id = string_field(*obj, "id");
        if (!id || id->empty()) return std::nullopt;
        return ClientMessage{RecallRequest{std::string(*id)}};
    }
    if (*kind == "name") {
        auto* name = string_field(*obj, "name");
        if (!name) return std::nullopt;
        return ClientMessage{NameRequest{std::string(*name)}};
    }
    return std::nullopt;
}

json::object to_json(const ServerEvent& event) {
    return std::visit([](const auto& e) -> json::object {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, Welcome>) {
            return {{"kind", "welcome"},
                    {"clientId", e.client_id},
                    {"identity", e.identity},
                    {"room", e.room},
                    {"members", members_to_json(e.members)}};
        } else if constexpr (std::is_same_v<T, Presence>) {
            return {{"kind", "presence"},
                    {"room", e.room},
                    {"members", members_to_json(e.members)}};
        } else if constexpr (std::is_same_v<T, ChatPosted>) {
            return {{"kind", "chat"},
                    {"id", e.id},
                    {"from", e.from},
                    {"name", e.name},
                    {"text", e.text},
                    {"timestamp", e.timestamp}};
        } else if constexpr (std::is_same_v<T, FileAvailable>) {
            return {{"kind", "file"},
                    {"id", e.id},
                    {"from", e.from},
                    {"name", e.name},
                    {"size", e.size},
                    {"mime", e.mime},
                    {"protected", e.is_protected},
                    {"viewOnly", e.view_only},
                    {"expiresAt", optional_to_json(e.expires_at)},
                    {"url", optional_to_json(e.url)},
                    {"timestamp", e.timestamp}};
        } else if constexpr (std::is_same_v<T, Recalled>) {
            return {{"kind", "recalled"},
                    {"id", e.id},
                    {"itemKind", to_string(e.kind)},
                    {"reason", to_string(e.trigger)}};
        } else if constexpr (std::is_same_v<T, RecallConfirmed>) {
            return {{"kind", "recall_ack"},
                    {"id", e.id},
                    {"itemKind", to_string(e.kind)},
                    {"reason", to_string(e.trigger)},
                    {"ownerUrl", optional_to_json(e.owner_url)}};
        } else if constexpr (std::is_same_v<T, Unlocked>) {
            return {{"kind", "unlocked"},
                    {"id", e.id},
                    {"by", e.by},
                    {"url", e.url}};
        } else if constexpr (std::is_same_v<T, Downloaded>) {
            return {{"kind", "downloaded"},
                    {"id", e.id},
                    {"by", e.by},
                    {"at", e.at}};
        } else {
            json::object out{{"kind", "error"},
                             {"error", to_string(e.category)},
                             {"message", e.message}};
            if (!e.id.empty()) out["id"] = e.id;
            return out;
        }
    }, event);
}

std::string serialize(const ServerEvent& event) {
    return json::serialize(to_json(event));
}

std::vector<MemberView> member_views(const std::vector<Member>& members) {
    std::vector<MemberView> out;
    out.reserve(members.size());
    for (const auto& m : members) {
        out.push_back(MemberView{m.identity(), m.name()});
    }
    return out;
}

std::string public_url(const std::string& id) { return "/files/public/" + id; }
std::string owner_url(const std::string& id)  { return "/files/owner/" + id; }
std::string peer_url(const std::string& id)   { return "/files/peer/" + id; }

} // namespace recallchat::chat
