#pragma once

#include <string>
#include <utility>
#include <variant>

namespace recallchat::chat {

enum class ErrorCategory {
    NotFound,
    Forbidden,
    InvalidInput,
    RoomFull,
    Storage,
};

inline const char* to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NotFound:     return "not_found";
        case ErrorCategory::Forbidden:    return "forbidden";
        case ErrorCategory::InvalidInput: return "invalid_input";
        case ErrorCategory::RoomFull:     return "room_full";
        case ErrorCategory::Storage:      return "storage";
    }
    return "unknown";
}

struct Error {
    ErrorCategory category;
    std::string message;
    // Set when a failed unlock destroyed the artifact.
    bool recalled = false;
};

inline Error make_error(ErrorCategory c, std::string message) {
    return Error{c, std::move(message)};
}

template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
bool ok(const Result<T>& r) { return std::holds_alternative<T>(r); }

} // namespace recallchat::chat
