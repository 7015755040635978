#include "chat/RecallEngine.h"

#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <memory>

namespace recallchat::chat {

namespace asio = boost::asio;

RecallEngine::RecallEngine(asio::io_context& ioc,
                           ArtifactRegistry& artifacts,
                           const StorageMover& storage,
                           EventSink& sink)
    : ioc_(ioc), artifacts_(artifacts), storage_(storage), sink_(sink) {}

void RecallEngine::arm(const std::string& id) {
    artifacts_.update(id, [&](Artifact& a) {
        if (a.recalled || !a.expires_at || a.timer) return;

        auto remaining = *a.expires_at - WallClock::now();
        if (remaining < WallClock::duration::zero()) remaining = WallClock::duration::zero();

        auto timer = std::make_shared<asio::steady_timer>(ioc_);
        // Round up so the timer never fires before expires_at.
        timer->expires_after(std::chrono::ceil<std::chrono::milliseconds>(remaining));
        timer->async_wait([this, id](const boost::system::error_code& ec) {
            if (ec == asio::error::operation_aborted) return;
            on_timer(id);
        });
        a.timer = std::move(timer);
    });
}

void RecallEngine::on_timer(const std::string& id) {
    // Cancellation is advisory; recall() no-ops if someone got there first.
    const RecallStatus status = recall(id, RecallTrigger::Expired);
    if (status == RecallStatus::Recalled) {
        std::cout << "[Recall] " << id << " expired\n";
    }
}

RecallStatus RecallEngine::recall(const std::string& id, RecallTrigger trigger) {
    RecallStatus status = RecallStatus::AlreadyRecalled;

    const bool found = artifacts_.update(id, [&](Artifact& a) {
        if (a.recalled) return;
        a.recalled = true;
        status = RecallStatus::Recalled;

        if (a.timer) {
            a.timer->cancel();
            a.timer.reset();
        }

        if (a.kind == ArtifactKind::File) {
            const MoveOutcome moved = storage_.move_to_restricted(a);
            if (moved == MoveOutcome::Deleted) {
                std::cerr << "[Recall] " << a.id << " deleted instead of moved\n";
            }
        }

        a.unlocked_for.reset();

        std::optional<std::string> retrieval;
        if (a.kind == ArtifactKind::File && a.restricted_path) retrieval = owner_url(a.id);

        // Published under the lock so per-room order matches state order.
        sink_.publish(a.room, Outbound{Recalled{a.id, a.kind, trigger}, Audience::NonOwner, a.owner});
        sink_.publish(a.room, Outbound{RecallConfirmed{a.id, a.kind, trigger, retrieval},
                                       Audience::Owner, a.owner});
    });

    if (!found) return RecallStatus::NotFound;
    return status;
}

RecallStatus RecallEngine::recall_by(const std::string& id,
                                     const std::string& identity,
                                     const std::string& client_id) {
    if (!artifacts_.get(id)) return RecallStatus::NotFound;
    if (!artifacts_.authorize_recall(id, identity, client_id)) return RecallStatus::Forbidden;
    return recall(id, RecallTrigger::Manual);
}

} // namespace recallchat::chat
