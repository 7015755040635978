#pragma once

#include "chat/ArtifactRegistry.h"
#include "chat/Errors.h"
#include "chat/EventSink.h"
#include "chat/RecallEngine.h"

#include <cstdint>
#include <string>

namespace recallchat::chat {

enum class AccessKind { Public, Owner, Peer };

inline const char* to_string(AccessKind k) {
    switch (k) {
        case AccessKind::Public: return "public";
        case AccessKind::Owner:  return "owner";
        case AccessKind::Peer:   return "peer";
    }
    return "public";
}

struct Reference {
    std::string url;
    AccessKind access = AccessKind::Public;
};

struct FileRef {
    std::string path;
    std::string name;
    std::string mime_type;
    std::uint64_t size = 0;
    bool inline_only = false;  // view-only: no download disposition
};

// Decides, per request, what a requester may reach. Nothing is cached: the
// registry is consulted on every call.
class AccessControl {
public:
    AccessControl(ArtifactRegistry& artifacts, RecallEngine& engine, EventSink& sink);

    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    Result<Reference> resolve(const std::string& id,
                              const std::string& identity,
                              const std::string& client_id);

    // One guess: a wrong password recalls the file for everyone.
    Result<Reference> unlock(const std::string& id,
                             const std::string& password,
                             const std::string& identity,
                             const std::string& client_id);

    Result<FileRef> open_public(const std::string& id, const std::string& identity,
                                const std::string& client_id);
    Result<FileRef> open_owner(const std::string& id, const std::string& identity,
                               const std::string& client_id);
    Result<FileRef> open_peer(const std::string& id, const std::string& identity,
                              const std::string& client_id);

private:
    void notify_download(const Artifact& a, const std::string& identity, const std::string& client_id);

    ArtifactRegistry& artifacts_;
    RecallEngine& engine_;
    EventSink& sink_;
};

} // namespace recallchat::chat
