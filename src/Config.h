#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <string>

namespace recallchat {

struct Config {
    std::string address = "0.0.0.0";
    unsigned short port = 9002;
    int io_threads = 1;
    int worker_threads = 2;
    std::string storage_root = "./recallchat-data";
    std::size_t event_buffer_capacity = 1000;
    std::size_t max_upload_bytes = 64 * 1024 * 1024;
    bool trust_forwarded_for = false;

    // Missing file -> defaults. Unreadable or malformed -> std::runtime_error.
    static Config load(const std::string& path);

    // Unknown keys are ignored; wrongly typed ones are an error.
    static Config from_json(const boost::json::value& v);

    // PORT and RECALLCHAT_STORAGE override whatever the file said.
    void apply_environment();
};

} // namespace recallchat
