#include "chat/PasswordHasher.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <utility>

namespace recallchat::chat {

PasswordHasher::Digest PasswordHasher::hash(std::string_view password) {
    std::string salt(kSaltBytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(salt.data()), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    Digest d;
    d.hash = derive(password, salt);
    d.salt = std::move(salt);
    return d;
}

std::string PasswordHasher::derive(std::string_view password, std::string_view salt) {
    std::string out(kHashBytes, '\0');
    const int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                                     reinterpret_cast<const unsigned char*>(salt.data()),
                                     static_cast<int>(salt.size()),
                                     kIterations, EVP_sha256(),
                                     static_cast<int>(out.size()),
                                     reinterpret_cast<unsigned char*>(out.data()));
    if (rc != 1) throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    return out;
}

bool PasswordHasher::equal(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace recallchat::chat
