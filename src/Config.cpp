#include "Config.h"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace recallchat {

namespace json = boost::json;

namespace {

std::int64_t int_field(const json::object& obj, const char* key, std::int64_t fallback,
                       std::int64_t lo, std::int64_t hi) {
    auto* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_int64() && !v->is_uint64()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be an integer");
    }
    const std::int64_t n = v->is_int64() ? v->as_int64() : static_cast<std::int64_t>(v->as_uint64());
    if (n < lo || n > hi) {
        throw std::runtime_error(std::string("config: '") + key + "' out of range");
    }
    return n;
}

std::string string_field(const json::object& obj, const char* key, const std::string& fallback) {
    auto* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_string()) throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    return std::string(v->get_string());
}

bool bool_field(const json::object& obj, const char* key, bool fallback) {
    auto* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_bool()) throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
    return v->get_bool();
}

} // namespace

Config Config::from_json(const json::value& v) {
    auto* obj = v.if_object();
    if (!obj) throw std::runtime_error("config: top level must be an object");

    Config c;
    c.address = string_field(*obj, "address", c.address);
    c.port = static_cast<unsigned short>(int_field(*obj, "port", c.port, 0, 65535));
    c.io_threads = static_cast<int>(int_field(*obj, "io_threads", c.io_threads, 1, 256));
    c.worker_threads = static_cast<int>(int_field(*obj, "worker_threads", c.worker_threads, 1, 256));
    c.storage_root = string_field(*obj, "storage_root", c.storage_root);
    c.event_buffer_capacity = static_cast<std::size_t>(
        int_field(*obj, "event_buffer_capacity", static_cast<std::int64_t>(c.event_buffer_capacity),
                  1, 1000000));
    c.max_upload_bytes = static_cast<std::size_t>(
        int_field(*obj, "max_upload_bytes", static_cast<std::int64_t>(c.max_upload_bytes),
                  1, std::numeric_limits<std::int64_t>::max()));
    c.trust_forwarded_for = bool_field(*obj, "trust_forwarded_for", c.trust_forwarded_for);
    return c;
}

Config Config::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[Config] " << path << " not found, using defaults\n";
        return Config{};
    }

    std::ifstream f(path);
    if (!f) throw std::runtime_error("config: cannot open " + path);
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) throw std::runtime_error("config: " + path + ": " + ec.message());
    return from_json(v);
}

void Config::apply_environment() {
    if (const char* p = std::getenv("PORT"); p && *p) {
        char* end = nullptr;
        const long n = std::strtol(p, &end, 10);
        if (*end == '\0' && n >= 0 && n <= 65535) {
            port = static_cast<unsigned short>(n);
        } else {
            std::cerr << "[Config] ignoring invalid PORT=" << p << "\n";
        }
    }
    if (const char* s = std::getenv("RECALLCHAT_STORAGE"); s && *s) {
        storage_root = s;
    }
}

} // namespace recallchat
