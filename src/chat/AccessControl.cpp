#include "chat/AccessControl.h"

#include "chat/PasswordHasher.h"

#include <utility>

namespace recallchat::chat {

namespace {

FileRef file_ref(const Artifact& a, const std::string& path) {
    return FileRef{path, a.name, a.mime_type, a.size, a.view_only};
}

} // namespace

AccessControl::AccessControl(ArtifactRegistry& artifacts, RecallEngine& engine, EventSink& sink)
    : artifacts_(artifacts), engine_(engine), sink_(sink) {}

Result<Reference> AccessControl::resolve(const std::string& id,
                                         const std::string& identity,
                                         const std::string& client_id) {
    Result<Reference> out = make_error(ErrorCategory::Forbidden, "access denied");

    const bool found = artifacts_.update(id, [&](Artifact& a) {
        if (a.kind != ArtifactKind::File) {
            out = make_error(ErrorCategory::InvalidInput, "not a file");
            return;
        }

        if (a.owner.matches(identity, client_id)) {
            if (a.restricted_path) {
                out = Reference{owner_url(a.id), AccessKind::Owner};
            } else if (a.public_path) {
                out = Reference{public_url(a.id), AccessKind::Public};
            } else {
                out = make_error(ErrorCategory::NotFound, "file no longer stored");
            }
            return;
        }

        if (a.recalled) {
            out = make_error(ErrorCategory::Forbidden, "item was recalled");
            return;
        }

        if (a.is_protected) {
            if (a.restricted_path && a.unlocked_for && *a.unlocked_for == identity) {
                out = Reference{peer_url(a.id), AccessKind::Peer};
            } else {
                out = make_error(ErrorCategory::Forbidden, "item is locked");
            }
            return;
        }

        if (a.view_only) {
            // First resolver becomes the only viewer; there is no re-binding.
            if (!a.unlocked_for) a.unlocked_for = identity;
            if (a.restricted_path && *a.unlocked_for == identity) {
                out = Reference{peer_url(a.id), AccessKind::Peer};
            } else {
                out = make_error(ErrorCategory::Forbidden, "item is bound to another viewer");
            }
            return;
        }

        if (a.public_path) {
            out = Reference{public_url(a.id), AccessKind::Public};
        }
    });

    if (!found) return make_error(ErrorCategory::NotFound, "unknown item");
    return out;
}

Result<Reference> AccessControl::unlock(const std::string& id,
                                        const std::string& password,
                                        const std::string& identity,
                                        const std::string& client_id) {
    auto snapshot = artifacts_.get(id);
    if (!snapshot) return make_error(ErrorCategory::NotFound, "unknown item");
    if (snapshot->kind != ArtifactKind::File || !snapshot->is_protected) {
        return make_error(ErrorCategory::InvalidInput, "item is not password protected");
    }
    if (snapshot->recalled) {
        Error e = make_error(ErrorCategory::Forbidden, "item was recalled");
        e.recalled = true;
        return e;
    }
    if (snapshot->owner.matches(identity, client_id)) {
        return make_error(ErrorCategory::Forbidden, "owner does not need to unlock");
    }

    // PBKDF2 is slow; derive before taking the lock.
    const std::string supplied = PasswordHasher::derive(password, snapshot->salt);

    bool matched = false;
    bool gone = false;
    artifacts_.update(id, [&](Artifact& a) {
        if (a.recalled) {
            gone = true;
            return;
        }
        if (!PasswordHasher::equal(supplied, a.password_hash)) return;

        matched = true;
        a.unlocked_for = identity;
        sink_.publish(a.room, Outbound{Unlocked{a.id, identity, peer_url(a.id)}, Audience::All, a.owner});
    });

    if (!matched) {
        if (!gone) engine_.recall(id, RecallTrigger::FailedUnlock);
        Error e = make_error(ErrorCategory::Forbidden,
                             gone ? "item was recalled" : "wrong password; item recalled");
        e.recalled = true;
        return e;
    }
    return Reference{peer_url(id), AccessKind::Peer};
}

Result<FileRef> AccessControl::open_public(const std::string& id,
                                           const std::string& identity,
                                           const std::string& client_id) {
    auto a = artifacts_.get(id);
    if (!a || a->kind != ArtifactKind::File) return make_error(ErrorCategory::NotFound, "unknown item");
    if (a->recalled || a->is_protected || a->view_only || !a->public_path) {
        return make_error(ErrorCategory::Forbidden, "not publicly available");
    }
    notify_download(*a, identity, client_id);
    return file_ref(*a, *a->public_path);
}

Result<FileRef> AccessControl::open_owner(const std::string& id,
                                          const std::string& identity,
                                          const std::string& client_id) {
    auto a = artifacts_.get(id);
    if (!a || a->kind != ArtifactKind::File) return make_error(ErrorCategory::NotFound, "unknown item");
    if (!a->owner.matches(identity, client_id)) return make_error(ErrorCategory::Forbidden, "owner only");

    if (a->restricted_path) return file_ref(*a, *a->restricted_path);
    if (a->public_path) return file_ref(*a, *a->public_path);
    return make_error(ErrorCategory::NotFound, "file no longer stored");
}

Result<FileRef> AccessControl::open_peer(const std::string& id,
                                         const std::string& identity,
                                         const std::string& client_id) {
    auto a = artifacts_.get(id);
    if (!a || a->kind != ArtifactKind::File) return make_error(ErrorCategory::NotFound, "unknown item");
    if (a->recalled || !a->restricted_path || !a->unlocked_for || *a->unlocked_for != identity) {
        return make_error(ErrorCategory::Forbidden, "not granted");
    }
    notify_download(*a, identity, client_id);
    return file_ref(*a, *a->restricted_path);
}

void AccessControl::notify_download(const Artifact& a,
                                    const std::string& identity,
                                    const std::string& client_id) {
    if (a.owner.matches(identity, client_id)) return;
    sink_.publish(a.room, Outbound{Downloaded{a.id, identity, to_epoch_ms(WallClock::now())},
                                   Audience::Owner, a.owner});
}

} // namespace recallchat::chat
