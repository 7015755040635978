#pragma once

#include "chat/Relay.h"
#include "networking/Dispatcher.h"
#include "networking/HttpApi.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace recallchat::networking {

struct ServerOptions {
    std::string address = "0.0.0.0";
    unsigned short port = 9002;
    bool trust_forwarded_for = false;
    std::size_t max_upload_bytes = 64 * 1024 * 1024;
};

// One listener for every transport: WebSocket upgrades become live-socket
// members, GET /events becomes a Server-Sent Events stream, everything else
// goes to HttpApi on the worker pool.
class RelayServer {
public:
    static constexpr std::uint16_t kRoomFullCloseCode = 4001;

    RelayServer(boost::asio::io_context& ioc,
                boost::asio::thread_pool& workers,
                const ServerOptions& options,
                chat::Relay& relay,
                HttpApi& api,
                Dispatcher& dispatcher);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close sockets and streams

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace recallchat::networking
