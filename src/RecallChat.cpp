#include "Config.h"
#include "chat/AccessControl.h"
#include "chat/ArtifactRegistry.h"
#include "chat/IDGenerator.hpp"
#include "chat/RecallEngine.h"
#include "chat/Relay.h"
#include "chat/RoomRegistry.h"
#include "chat/StorageMover.h"
#include "networking/Dispatcher.h"
#include "networking/HttpApi.h"
#include "networking/RelayServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace recallchat;

    Config config;
    try {
        config = Config::load(argc > 1 ? argv[1] : "recallchat.json");
        config.apply_environment();
    } catch (const std::exception& e) {
        std::cerr << "[RecallChat] " << e.what() << "\n";
        return 1;
    }

    chat::StorageMover storage(config.storage_root);
    try {
        storage.prepare();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[RecallChat] storage: " << e.what() << "\n";
        return 1;
    }

    boost::asio::io_context ioc;
    boost::asio::thread_pool workers(static_cast<std::size_t>(config.worker_threads));

    // Every registry lives here and is passed down by reference.
    chat::IDGenerator idgen;
    chat::RoomRegistry rooms;
    chat::ArtifactRegistry artifacts(idgen, storage);
    networking::Dispatcher dispatcher(config.event_buffer_capacity);
    chat::RecallEngine engine(ioc, artifacts, storage, dispatcher);
    chat::AccessControl access(artifacts, engine, dispatcher);
    chat::Relay relay(idgen, rooms, artifacts, engine, dispatcher);
    networking::HttpApi api(relay, access, dispatcher);

    networking::ServerOptions options;
    options.address = config.address;
    options.port = config.port;
    options.trust_forwarded_for = config.trust_forwarded_for;
    options.max_upload_bytes = config.max_upload_bytes;

    std::unique_ptr<networking::RelayServer> server;
    try {
        server = std::make_unique<networking::RelayServer>(ioc, workers, options, relay, api, dispatcher);
    } catch (const boost::system::system_error& e) {
        std::cerr << "[RecallChat] cannot listen on " << config.address << ":" << config.port
                  << ": " << e.what() << "\n";
        return 1;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[RecallChat] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[RecallChat] listening on " << config.address << ":" << server->port()
              << " (storage " << config.storage_root << ")\n";

    std::vector<std::thread> threads;
    for (int i = 1; i < config.io_threads; ++i) {
        threads.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : threads) t.join();

    workers.join();
    std::cout << "[RecallChat] exit.\n";
    return 0;
}
