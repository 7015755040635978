#pragma once

#include "chat/EventSink.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace recallchat::testing {

// Records everything the chat layer emits.
class RecordingSink : public chat::EventSink {
public:
    struct Published {
        std::string room;
        chat::Outbound out;
    };

    void attach(const chat::Member& member, Deliver) override {
        std::lock_guard<std::mutex> lk(mu_);
        attached.push_back(member.connection());
    }

    void detach(chat::ConnectionId connection) override {
        std::lock_guard<std::mutex> lk(mu_);
        detached.push_back(connection);
    }

    void publish(const std::string& room, const chat::Outbound& out) override {
        std::lock_guard<std::mutex> lk(mu_);
        published.push_back(Published{room, out});
    }

    void send_direct(chat::ConnectionId connection, const chat::ServerEvent& event) override {
        std::lock_guard<std::mutex> lk(mu_);
        direct.emplace_back(connection, event);
    }

    void close_room(const std::string& room) override {
        std::lock_guard<std::mutex> lk(mu_);
        closed_rooms.push_back(room);
    }

    template <typename T>
    std::vector<T> events_of() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        for (const auto& p : published) {
            if (auto* e = std::get_if<T>(&p.out.event)) out.push_back(*e);
        }
        return out;
    }

    template <typename T>
    std::vector<Published> published_of() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<Published> out;
        for (const auto& p : published) {
            if (std::holds_alternative<T>(p.out.event)) out.push_back(p);
        }
        return out;
    }

    template <typename T>
    std::vector<T> direct_of(chat::ConnectionId connection) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        for (const auto& [c, e] : direct) {
            if (c != connection) continue;
            if (auto* t = std::get_if<T>(&e)) out.push_back(*t);
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        published.clear();
        direct.clear();
    }

    std::vector<chat::ConnectionId> attached;
    std::vector<chat::ConnectionId> detached;
    std::vector<Published> published;
    std::vector<std::pair<chat::ConnectionId, chat::ServerEvent>> direct;
    std::vector<std::string> closed_rooms;

private:
    mutable std::mutex mu_;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("recallchat-test-" + std::to_string(rd()) + "-" + std::to_string(counter_++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    static inline std::atomic<int> counter_{0};
    std::filesystem::path path_;
};

inline std::string read_file(const std::string& path) {
    std::string out;
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return out;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    std::fclose(f);
    return out;
}

} // namespace recallchat::testing
