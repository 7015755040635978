#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace recallchat::chat {

// PBKDF2-HMAC-SHA256 over OpenSSL libcrypto. Salts and hashes are raw bytes.
class PasswordHasher {
public:
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kHashBytes = 32;
    static constexpr int kIterations = 100000;

    struct Digest {
        std::string salt;
        std::string hash;
    };

    // Throws std::runtime_error if OpenSSL fails.
    static Digest hash(std::string_view password);
    static std::string derive(std::string_view password, std::string_view salt);

    // Constant-time comparison.
    static bool equal(std::string_view a, std::string_view b);
};

} // namespace recallchat::chat
