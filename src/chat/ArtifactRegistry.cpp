#include "chat/ArtifactRegistry.h"

#include "chat/PasswordHasher.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace recallchat::chat {

ArtifactRegistry::ArtifactRegistry(IDGenerator& idgen, const StorageMover& storage)
    : idgen_(idgen), storage_(storage) {}

std::int64_t ArtifactRegistry::clamp_ttl(std::int64_t ttl_seconds) {
    return std::clamp<std::int64_t>(ttl_seconds, 0, kMaxTtlSeconds);
}

std::string ArtifactRegistry::truncate_text(std::string text, std::size_t max_units) {
    std::size_t units = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        // Continuation bytes (10xxxxxx) do not start a code point.
        if ((c & 0xC0) == 0x80) continue;
        const std::size_t width = c >= 0xF0 ? 2 : 1;
        if (units + width > max_units) {
            text.resize(i);
            break;
        }
        units += width;
    }
    return text;
}

Artifact ArtifactRegistry::create_chat(const std::string& room, const Owner& owner, std::string text,
                                       const Observer& observer) {
    Artifact a;
    a.id = idgen_.artifactID();
    a.room = room;
    a.kind = ArtifactKind::Chat;
    a.owner = owner;
    a.created_at = WallClock::now();
    a.text = truncate_text(std::move(text), kMaxTextUnits);

    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = artifacts_.emplace(a.id, a);
    (void)inserted;
    if (observer) observer(it->second);
    return a;
}

Result<Artifact> ArtifactRegistry::create_file(const std::string& room,
                                               const Owner& owner,
                                               const FileUpload& upload,
                                               std::int64_t ttl_seconds,
                                               const std::string& password,
                                               bool view_only,
                                               const Observer& observer) {
    Artifact a;
    a.id = idgen_.artifactID();
    a.room = room;
    a.kind = ArtifactKind::File;
    a.owner = owner;
    a.name = StorageMover::sanitize_file_name(upload.name);
    a.stored_name = StorageMover::stored_name_for(a.id, upload.name);
    a.size = upload.bytes.size();
    a.mime_type = upload.mime_type.empty() ? "application/octet-stream" : upload.mime_type;
    a.is_protected = !password.empty();
    a.view_only = view_only && !a.is_protected;

    if (a.is_protected) {
        auto digest = PasswordHasher::hash(password);
        a.salt = std::move(digest.salt);
        a.password_hash = std::move(digest.hash);
    }

    // Disk write happens outside the lock.
    const Location where = (a.is_protected || a.view_only) ? Location::Vault : Location::Public;
    std::error_code ec;
    auto path = storage_.store(a.stored_name, upload.bytes, where, ec);
    if (!path) {
        std::cerr << "[Artifacts] store " << a.stored_name << " failed: " << ec.message() << "\n";
        return make_error(ErrorCategory::Storage, "could not store file");
    }
    if (where == Location::Vault) {
        a.restricted_path = std::move(*path);
    } else {
        a.public_path = std::move(*path);
    }

    a.created_at = WallClock::now();
    const std::int64_t ttl = clamp_ttl(ttl_seconds);
    if (ttl > 0) a.expires_at = a.created_at + std::chrono::seconds(ttl);

    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = artifacts_.emplace(a.id, a);
    (void)inserted;
    if (observer) observer(it->second);
    return a;
}

std::optional<Artifact> ArtifactRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = artifacts_.find(id);
    if (it == artifacts_.end()) return std::nullopt;
    return it->second;
}

bool ArtifactRegistry::authorize_recall(const std::string& id,
                                        const std::string& identity,
                                        const std::string& client_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = artifacts_.find(id);
    if (it == artifacts_.end()) return false;
    return it->second.owner.matches(identity, client_id);
}

std::size_t ArtifactRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return artifacts_.size();
}

} // namespace recallchat::chat
