#pragma once

#include "chat/AccessControl.h"
#include "chat/Errors.h"
#include "chat/Relay.h"
#include "networking/Dispatcher.h"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <string>
#include <variant>

namespace recallchat::networking {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using Response = std::variant<StringResponse, FileResponse>;

// Out-of-band endpoints. Runs on the worker pool: uploads and file opens do
// disk I/O here, never on the event-delivery path.
//
//   POST /upload?room=            raw body + X-File-Name, X-Client-Id,
//                                 X-TTL-Seconds, X-File-Password, X-View-Only
//   POST /unlock                  {"id","password"}
//   GET  /resolve?id=&clientId=
//   GET  /poll?room=&since=&clientId=
//   GET  /files/{public,owner,peer}/<id>
//
// Room-scoped endpoints require a live member of that room; the session id
// comes from X-Client-Id or ?clientId=.
class HttpApi {
public:
    HttpApi(chat::Relay& relay, chat::AccessControl& access, Dispatcher& dispatcher);

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    Response handle(const Request& req, const std::string& identity);

    static http::status status_of(chat::ErrorCategory category);
    static StringResponse error_response(const Request& req, const chat::Error& e);

    // Raw session id as sent by the client; not yet verified.
    static std::string client_id_of(const Request& req);

private:
    StringResponse upload(const Request& req, const std::string& identity);
    StringResponse unlock(const Request& req, const std::string& identity);
    StringResponse resolve(const Request& req, const std::string& identity);
    StringResponse poll(const Request& req, const std::string& identity);
    Response serve_file(const Request& req, const std::string& identity);

    std::string session_of(const std::string& identity, const std::string& client_id) const;

    chat::Relay& relay_;
    chat::AccessControl& access_;
    Dispatcher& dispatcher_;
};

} // namespace recallchat::networking
