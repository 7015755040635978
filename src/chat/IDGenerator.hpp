#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace recallchat::chat {

// ULID ids: 48-bit millisecond timestamp followed by 80 random bits,
// Crockford base32 encoded (26 chars). Monotonic within one millisecond.
class IDGenerator {
public:
    enum class Kind { Artifact, Client };

    IDGenerator()
        : rng_(seed_engine_()) {}

    IDGenerator(const IDGenerator&) = delete;
    IDGenerator& operator=(const IDGenerator&) = delete;

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + next_ulid_();
    }

    std::string artifactID() { return make(Kind::Artifact); }
    std::string clientID()   { return make(Kind::Client); }

private:
    using u128 = unsigned __int128;

    static constexpr u128 kRandomMask = (u128(1) << 80) - 1;

    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Artifact: return "item";
            case Kind::Client:   return "client";
        }
        return "id";
    }

    std::string next_ulid_() {
        const std::uint64_t ts_ms = now_ms_();
        u128 random80 = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_random_ = (u128(dist64_(rng_)) << 16 | (dist64_(rng_) >> 48)) & kRandomMask;
            } else {
                last_random_ = (last_random_ + 1) & kRandomMask;
            }
            random80 = last_random_;
        }

        const u128 value = (u128(ts_ms & 0xFFFFFFFFFFFFull) << 80) | random80;
        return encode_(value);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits -> 26 base32 digits, most significant first (top 2 bits are always 0).
    static std::string encode_(u128 value) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        std::array<char, 26> digits{};
        for (int i = 25; i >= 0; --i) {
            digits[static_cast<std::size_t>(i)] = alphabet[static_cast<unsigned>(value & 0x1F)];
            value >>= 5;
        }
        return std::string(digits.begin(), digits.end());
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_random_ = 0;
};

} // namespace recallchat::chat
