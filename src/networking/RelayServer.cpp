#include "networking/RelayServer.h"

#include "networking/Identity.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace recallchat::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class RelayServer::Impl {
public:
    Impl(asio::io_context& ioc,
         asio::thread_pool& workers,
         const ServerOptions& options,
         chat::Relay& relay,
         HttpApi& api,
         Dispatcher& dispatcher)
        : ioc_(ioc),
          workers_(workers),
          options_(options),
          relay_(relay),
          api_(api),
          dispatcher_(dispatcher),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(options.address), options.port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<WebSocketSession>> sockets;
        std::vector<std::shared_ptr<StreamSession>> streams;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [id, weak] : sockets_) {
                if (auto s = weak.lock()) sockets.push_back(std::move(s));
            }
            for (auto& [id, weak] : streams_) {
                if (auto s = weak.lock()) streams.push_back(std::move(s));
            }
            sockets_.clear();
            streams_.clear();
        }
        for (auto& s : sockets) s->close();
        for (auto& s : streams) s->close();
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    // ---- live socket member ----
    class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
    public:
        // Larger chat frames are dropped with an error reply; past the hard
        // cap the socket is closed.
        static constexpr std::size_t kMaxFrameBytes = 64 * 1024;
        static constexpr std::size_t kHardFrameBytes = 4 * 1024 * 1024;
        static constexpr std::size_t kReadChunk = 16 * 1024;

        WebSocketSession(Impl& server, tcp::socket socket, chat::ConnectionId id,
                         std::string identity, std::string room)
            : server_(server),
              id_(id),
              identity_(std::move(identity)),
              room_(std::move(room)),
              ws_(std::move(socket)) {}

        void start(Request req) {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(kHardFrameBytes);

            upgrade_ = std::move(req);
            ws_.async_accept(
                upgrade_,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) return self->fail("accept", ec);
                    self->admit();
                });
        }

        void send(const std::string& msg) {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), msg] {
                    if (self->closed_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this()] {
                    if (self->closed_) return;
                    self->ws_.async_close(
                        websocket::close_code::going_away,
                        [self](beast::error_code) {});
                });
        }

    private:
        void admit() {
            std::weak_ptr<WebSocketSession> weak = shared_from_this();
            auto admitted = server_.relay_.connect(
                id_, identity_, room_,
                [weak](const std::string& msg) {
                    if (auto self = weak.lock()) self->send(msg);
                });

            if (auto* err = std::get_if<chat::Error>(&admitted)) {
                return reject(chat::serialize(chat::Failure{err->category, err->message, {}}));
            }

            admitted_ = true;
            server_.add_socket(id_, weak);
            do_read();
        }

        // Room full: one error frame, then a distinguishable close.
        void reject(std::string frame) {
            auto msg = std::make_shared<std::string>(std::move(frame));
            ws_.text(true);
            ws_.async_write(
                asio::buffer(*msg),
                [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                    if (ec) return self->fail("reject", ec);
                    self->closed_ = true;
                    self->ws_.async_close(
                        websocket::close_reason(kRoomFullCloseCode, "room full"),
                        [self](beast::error_code ec) {
                            if (ec) self->fail("close", ec);
                        });
                });
        }

        void do_read() {
            ws_.async_read_some(
                buffer_, kReadChunk,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);
                    self->on_read();
                });
        }

        void on_read() {
            if (buffer_.size() > kMaxFrameBytes) {
                oversized_ = true;
                buffer_.consume(buffer_.size());
            }
            if (!ws_.is_message_done()) return do_read();

            if (oversized_) {
                oversized_ = false;
                std::cerr << "[Session " << id_ << "] dropped oversized frame\n";
                server_.dispatcher_.send_direct(
                    id_, chat::Failure{chat::ErrorCategory::InvalidInput, "frame too large", {}});
                return do_read();
            }

            std::string msg = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());

            server_.relay_.handle_message(id_, msg);

            do_read();
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        void on_close_or_fail(beast::error_code ec) {
            if (closed_) return;
            closed_ = true;

            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) fail("io", ec);

            server_.remove_socket(id_);
            if (admitted_) server_.relay_.disconnect(id_);
            admitted_ = false;
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Session " << id_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        chat::ConnectionId id_;
        std::string identity_;
        std::string room_;

        websocket::stream<beast::tcp_stream> ws_;
        Request upgrade_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool admitted_ = false;
        bool closed_ = false;
        bool oversized_ = false;
    };

    // ---- push stream (Server-Sent Events) ----
    class StreamSession : public std::enable_shared_from_this<StreamSession> {
    public:
        StreamSession(Impl& server, tcp::socket socket, std::string identity, std::string room)
            : server_(server),
              stream_(std::move(socket)),
              identity_(std::move(identity)),
              room_(std::move(room)) {}

        void start(unsigned version) {
            stream_.expires_never();

            res_.version(version);
            res_.result(http::status::ok);
            res_.set(http::field::content_type, "text/event-stream");
            res_.set(http::field::cache_control, "no-cache");
            res_.set("X-Accel-Buffering", "no");
            res_.keep_alive(false);

            http::async_write_header(
                stream_, sr_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->fail("header", ec);
                    self->subscribe();
                });
        }

        void send(std::string frame) {
            asio::post(
                stream_.get_executor(),
                [self = shared_from_this(), frame = std::move(frame)]() mutable {
                    if (self->done_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(frame));
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(stream_.get_executor(), [self = shared_from_this()] { self->finish(); });
        }

    private:
        void subscribe() {
            std::weak_ptr<StreamSession> weak = shared_from_this();
            stream_id_ = server_.dispatcher_.attach_stream(
                room_, identity_,
                [weak](const std::string& msg) {
                    if (auto self = weak.lock()) self->send("data: " + msg + "\n\n");
                });
            subscribed_ = true;
            server_.add_stream(stream_id_, weak);

            send(": subscribed to " + room_ + "\n\n");
            do_watch();
        }

        // Clients never send on a stream; any read completion means it is gone.
        void do_watch() {
            stream_.async_read_some(
                asio::buffer(scratch_),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->finish();
                    self->do_watch();
                });
        }

        void do_write() {
            asio::async_write(
                stream_,
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->finish();

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        void finish() {
            if (done_) return;
            done_ = true;

            if (subscribed_) {
                server_.dispatcher_.detach_stream(stream_id_);
                server_.remove_stream(stream_id_);
            }

            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.close();
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Stream " << room_ << "] " << what << ": " << ec.message() << "\n";
            finish();
        }

        Impl& server_;
        beast::tcp_stream stream_;
        std::string identity_;
        std::string room_;

        http::response<http::empty_body> res_;
        http::response_serializer<http::empty_body> sr_{res_};

        std::array<char, 512> scratch_{};
        std::deque<std::string> write_queue_;
        Dispatcher::StreamId stream_id_ = 0;
        bool subscribed_ = false;
        bool done_ = false;
    };

    // ---- plain HTTP; upgrades hand the socket over ----
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)) {
            beast::error_code ec;
            auto ep = stream_.socket().remote_endpoint(ec);
            if (!ec) remote_ = ep.address();
        }

        void start() {
            asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
        }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(server_.options_.max_upload_bytes);
            stream_.expires_after(std::chrono::seconds(60));

            http::async_read(
                stream_, buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_close();
            if (ec) return fail("read", ec);

            Request req = parser_->release();

            std::string forwarded;
            if (auto it = req.find("X-Forwarded-For"); it != req.end()) forwarded = std::string(it->value());
            const std::string identity =
                resolve_identity(remote_, forwarded, server_.options_.trust_forwarded_for);

            const std::string_view target(req.target().data(), req.target().size());

            if (websocket::is_upgrade(req)) {
                stream_.expires_never();
                std::make_shared<WebSocketSession>(
                    server_, stream_.release_socket(), server_.next_connection_id_++,
                    identity, room_from_target(target))->start(std::move(req));
                return;
            }

            const std::string_view path = path_of(target);
            if (req.method() == http::verb::get && (path == "/events" || path.substr(0, 8) == "/events/")) {
                const std::string room = room_from_target(target);
                if (!server_.relay_.is_member(room, identity, HttpApi::client_id_of(req))) {
                    return send_response(HttpApi::error_response(
                        req, chat::make_error(chat::ErrorCategory::Forbidden, "not a member of this room")));
                }
                stream_.expires_never();
                std::make_shared<StreamSession>(
                    server_, stream_.release_socket(), identity, room)->start(req.version());
                return;
            }

            // Disk I/O and PBKDF2 stay off the io_context threads.
            asio::post(
                server_.workers_,
                [self = shared_from_this(), req = std::move(req), identity]() {
                    Response res = self->server_.api_.handle(req, identity);
                    asio::post(
                        self->stream_.get_executor(),
                        [self, res = std::move(res)]() mutable { self->reply(std::move(res)); });
                });
        }

        void reply(Response res) {
            std::visit([this](auto& msg) { send_response(std::move(msg)); }, res);
        }

        template <typename Message>
        void send_response(Message&& msg) {
            auto sp = std::make_shared<std::decay_t<Message>>(std::forward<Message>(msg));
            stream_.expires_after(std::chrono::seconds(60));

            http::async_write(
                stream_, *sp,
                [self = shared_from_this(), sp](beast::error_code ec, std::size_t) {
                    if (ec) return self->fail("write", ec);
                    if (sp->need_eof()) return self->do_close();
                    self->do_read();
                });
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        void fail(const char* what, beast::error_code ec) {
            if (ec == asio::error::operation_aborted || ec == beast::error::timeout) return;
            std::cerr << "[http " << remote_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        asio::ip::address remote_;
    };

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    void add_socket(chat::ConnectionId id, std::weak_ptr<WebSocketSession> session) {
        std::lock_guard<std::mutex> lk(mu_);
        sockets_[id] = std::move(session);
    }

    void remove_socket(chat::ConnectionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sockets_.erase(id);
    }

    void add_stream(Dispatcher::StreamId id, std::weak_ptr<StreamSession> session) {
        std::lock_guard<std::mutex> lk(mu_);
        streams_[id] = std::move(session);
    }

    void remove_stream(Dispatcher::StreamId id) {
        std::lock_guard<std::mutex> lk(mu_);
        streams_.erase(id);
    }

    asio::io_context& ioc_;
    asio::thread_pool& workers_;
    ServerOptions options_;
    chat::Relay& relay_;
    HttpApi& api_;
    Dispatcher& dispatcher_;
    tcp::acceptor acceptor_;

    std::atomic<chat::ConnectionId> next_connection_id_{1};

    std::mutex mu_;
    std::unordered_map<chat::ConnectionId, std::weak_ptr<WebSocketSession>> sockets_;
    std::unordered_map<Dispatcher::StreamId, std::weak_ptr<StreamSession>> streams_;
};

// ---- RelayServer wrapper ----

RelayServer::RelayServer(asio::io_context& ioc,
                         asio::thread_pool& workers,
                         const ServerOptions& options,
                         chat::Relay& relay,
                         HttpApi& api,
                         Dispatcher& dispatcher)
    : impl_(new Impl(ioc, workers, options, relay, api, dispatcher)) {}

void RelayServer::start() { impl_->start(); }
void RelayServer::stop() { impl_->stop(); }

unsigned short RelayServer::port() const { return impl_->port(); }

RelayServer::~RelayServer() = default;

} // namespace recallchat::networking
