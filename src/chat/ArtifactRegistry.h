#pragma once

#include "chat/Artifact.h"
#include "chat/Errors.h"
#include "chat/IDGenerator.hpp"
#include "chat/StorageMover.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace recallchat::chat {

struct FileUpload {
    std::string name;
    std::string mime_type;
    std::string_view bytes;
};

// Exclusive owner of every Artifact record. Mutations go through update(),
// which is also the exclusion point for recall, unlock and timer arming.
class ArtifactRegistry {
public:
    static constexpr std::size_t kMaxTextUnits = 4000;  // UTF-16 code units
    static constexpr std::int64_t kMaxTtlSeconds = 31LL * 24 * 60 * 60;

    // Runs under the registry lock right after insertion.
    using Observer = std::function<void(const Artifact&)>;

    ArtifactRegistry(IDGenerator& idgen, const StorageMover& storage);

    ArtifactRegistry(const ArtifactRegistry&) = delete;
    ArtifactRegistry& operator=(const ArtifactRegistry&) = delete;

    Artifact create_chat(const std::string& room, const Owner& owner, std::string text,
                         const Observer& observer = {});

    // Protected and view-only files go to the vault from the start.
    Result<Artifact> create_file(const std::string& room,
                                 const Owner& owner,
                                 const FileUpload& upload,
                                 std::int64_t ttl_seconds,
                                 const std::string& password,
                                 bool view_only,
                                 const Observer& observer = {});

    std::optional<Artifact> get(const std::string& id) const;

    bool authorize_recall(const std::string& id,
                          const std::string& identity,
                          const std::string& client_id) const;

    template <typename Fn>
    bool update(const std::string& id, Fn&& fn) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = artifacts_.find(id);
        if (it == artifacts_.end()) return false;
        fn(it->second);
        return true;
    }

    std::size_t size() const;

    static std::int64_t clamp_ttl(std::int64_t ttl_seconds);
    // Cuts at a code point boundary so the text needs at most max_units
    // UTF-16 code units; characters outside the BMP count as two.
    static std::string truncate_text(std::string text, std::size_t max_units);

private:
    IDGenerator& idgen_;
    const StorageMover& storage_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Artifact> artifacts_;
};

} // namespace recallchat::chat
