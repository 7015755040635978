#include "networking/HttpApi.h"

#include "networking/Identity.h"

#include <charconv>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace recallchat::networking {

namespace beast = boost::beast;
namespace json = boost::json;

namespace {

StringResponse json_response(const Request& req, http::status status, const json::object& body) {
    StringResponse res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

std::string_view target_of(const Request& req) {
    return std::string_view(req.target().data(), req.target().size());
}

std::string header_or_empty(const Request& req, beast::string_view name) {
    auto it = req.find(name);
    if (it == req.end()) return {};
    return std::string(it->value());
}

// Anything unparseable falls back to the given default.
std::int64_t parse_int(std::string_view s, std::int64_t fallback) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return fallback;
    return v;
}

bool parse_flag(const std::string& s) {
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

HttpApi::HttpApi(chat::Relay& relay, chat::AccessControl& access, Dispatcher& dispatcher)
    : relay_(relay), access_(access), dispatcher_(dispatcher) {}

http::status HttpApi::status_of(chat::ErrorCategory category) {
    switch (category) {
        case chat::ErrorCategory::NotFound:     return http::status::not_found;
        case chat::ErrorCategory::Forbidden:    return http::status::forbidden;
        case chat::ErrorCategory::InvalidInput: return http::status::bad_request;
        case chat::ErrorCategory::RoomFull:     return http::status::conflict;
        case chat::ErrorCategory::Storage:      return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

StringResponse HttpApi::error_response(const Request& req, const chat::Error& e) {
    json::object body{{"ok", false},
                      {"error", chat::to_string(e.category)},
                      {"message", e.message}};
    if (e.recalled) body["recalled"] = true;
    return json_response(req, status_of(e.category), body);
}

std::string HttpApi::client_id_of(const Request& req) {
    std::string id = header_or_empty(req, "X-Client-Id");
    if (id.empty()) {
        if (auto q = query_param(target_of(req), "clientId")) {
            id = *q;
        }
    }
    return id;
}

std::string HttpApi::session_of(const std::string& identity, const std::string& client_id) const {
    return relay_.verified_session(identity, client_id);
}

Response HttpApi::handle(const Request& req, const std::string& identity) {
    const std::string_view path = path_of(target_of(req));

    try {
        if (path == "/upload") {
            if (req.method() != http::verb::post) {
                return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "POST required"));
            }
            return upload(req, identity);
        }
        if (path == "/unlock") {
            if (req.method() != http::verb::post) {
                return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "POST required"));
            }
            return unlock(req, identity);
        }
        if (req.method() != http::verb::get && req.method() != http::verb::head) {
            return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "unsupported method"));
        }
        if (path == "/resolve") return resolve(req, identity);
        if (path == "/poll" || starts_with(path, "/poll/")) return poll(req, identity);
        if (starts_with(path, "/files/")) return serve_file(req, identity);
    } catch (const std::runtime_error& e) {
        std::cerr << "[HttpApi] " << path << ": " << e.what() << "\n";
        return error_response(req, chat::make_error(chat::ErrorCategory::Storage, "internal error"));
    }

    return error_response(req, chat::make_error(chat::ErrorCategory::NotFound, "no such endpoint"));
}

StringResponse HttpApi::upload(const Request& req, const std::string& identity) {
    chat::UploadRequest up;
    up.room = room_from_target(target_of(req));
    up.identity = identity;
    up.client_id = client_id_of(req);
    up.name = url_decode(header_or_empty(req, "X-File-Name"));
    up.mime_type = header_or_empty(req, "Content-Type");
    up.bytes = req.body();
    up.ttl_seconds = parse_int(header_or_empty(req, "X-TTL-Seconds"), 0);
    up.password = header_or_empty(req, "X-File-Password");
    up.view_only = parse_flag(header_or_empty(req, "X-View-Only"));

    if (up.name.empty()) {
        return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "missing X-File-Name"));
    }

    auto result = relay_.upload(up);
    if (auto* err = std::get_if<chat::Error>(&result)) return error_response(req, *err);

    const auto& receipt = std::get<chat::UploadReceipt>(result);
    json::object body{{"ok", true},
                      {"id", receipt.id},
                      {"room", receipt.room},
                      {"ownerUrl", receipt.owner_url}};
    body["url"] = receipt.url ? json::value(*receipt.url) : json::value(nullptr);
    body["expiresAt"] = receipt.expires_at ? json::value(*receipt.expires_at) : json::value(nullptr);
    return json_response(req, http::status::ok, body);
}

StringResponse HttpApi::unlock(const Request& req, const std::string& identity) {
    json::error_code ec;
    json::value v = json::parse(req.body(), ec);
    const json::object* obj = ec ? nullptr : v.if_object();
    if (!obj) {
        return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "expected a JSON object"));
    }

    const json::value* id = obj->if_contains("id");
    const json::value* password = obj->if_contains("password");
    if (!id || !id->is_string() || !password || !password->is_string()) {
        return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "id and password required"));
    }

    std::string client_id = client_id_of(req);
    if (const json::value* cid = obj->if_contains("clientId"); cid && cid->is_string()) {
        client_id = std::string(cid->get_string());
    }

    auto result = access_.unlock(std::string(id->get_string()), std::string(password->get_string()),
                                 identity, session_of(identity, client_id));
    if (auto* err = std::get_if<chat::Error>(&result)) return error_response(req, *err);

    const auto& ref = std::get<chat::Reference>(result);
    return json_response(req, http::status::ok,
                         json::object{{"ok", true}, {"url", ref.url}, {"access", chat::to_string(ref.access)}});
}

StringResponse HttpApi::resolve(const Request& req, const std::string& identity) {
    auto id = query_param(target_of(req), "id");
    if (!id || id->empty()) {
        return error_response(req, chat::make_error(chat::ErrorCategory::InvalidInput, "missing id"));
    }

    auto result = access_.resolve(*id, identity, session_of(identity, client_id_of(req)));
    if (auto* err = std::get_if<chat::Error>(&result)) return error_response(req, *err);

    const auto& ref = std::get<chat::Reference>(result);
    return json_response(req, http::status::ok,
                         json::object{{"ok", true}, {"url", ref.url}, {"access", chat::to_string(ref.access)}});
}

StringResponse HttpApi::poll(const Request& req, const std::string& identity) {
    const std::string room = room_from_target(target_of(req));
    const std::string client_id = client_id_of(req);
    if (!relay_.is_member(room, identity, client_id)) {
        return error_response(req, chat::make_error(chat::ErrorCategory::Forbidden, "not a member of this room"));
    }

    std::int64_t since = parse_int(query_param(target_of(req), "since").value_or(""), 0);
    if (since < 0) since = 0;

    PollResult result = dispatcher_.poll(room, static_cast<std::uint64_t>(since), identity, client_id);

    json::object body{{"ok", true}, {"room", room}};
    body["events"] = std::move(result.events);
    body["next"] = result.next;
    body["reset"] = result.reset;
    return json_response(req, http::status::ok, body);
}

Response HttpApi::serve_file(const Request& req, const std::string& identity) {
    // /files/<gate>/<id>
    std::string_view rest = path_of(target_of(req)).substr(std::string_view("/files/").size());
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return error_response(req, chat::make_error(chat::ErrorCategory::NotFound, "no such file"));
    }
    const std::string_view gate = rest.substr(0, slash);
    const std::string id = url_decode(rest.substr(slash + 1));
    const std::string client_id = session_of(identity, client_id_of(req));

    chat::Result<chat::FileRef> opened = chat::make_error(chat::ErrorCategory::NotFound, "no such file");
    if (gate == "public") {
        opened = access_.open_public(id, identity, client_id);
    } else if (gate == "owner") {
        opened = access_.open_owner(id, identity, client_id);
    } else if (gate == "peer") {
        opened = access_.open_peer(id, identity, client_id);
    }
    if (auto* err = std::get_if<chat::Error>(&opened)) return error_response(req, *err);

    const auto& ref = std::get<chat::FileRef>(opened);

    beast::error_code ec;
    http::file_body::value_type body;
    body.open(ref.path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        // Recalled or moved between the check and the open.
        return error_response(req, chat::make_error(chat::ErrorCategory::NotFound, "file no longer stored"));
    }

    const auto size = body.size();
    FileResponse res{std::piecewise_construct, std::make_tuple(std::move(body)),
                     std::make_tuple(http::status::ok, req.version())};
    res.set(http::field::content_type, ref.mime_type);
    res.set(http::field::cache_control, "no-store");
    res.set(http::field::content_disposition,
            std::string(ref.inline_only ? "inline" : "attachment") + "; filename=\"" + ref.name + "\"");
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
}

} // namespace recallchat::networking
