#pragma once

#include "chat/ArtifactRegistry.h"
#include "chat/EventSink.h"
#include "chat/StorageMover.h"

#include <boost/asio/io_context.hpp>

#include <string>

namespace recallchat::chat {

enum class RecallStatus {
    Recalled,
    AlreadyRecalled,
    NotFound,
    Forbidden,
};

// Live -> Recalled, the only transition an artifact has. Manual requests,
// TTL timers and failed unlocks all end up in recall(), which checks and sets
// the flag under the registry lock before any side effect: the first caller
// wins and every later one is a no-op.
class RecallEngine {
public:
    RecallEngine(boost::asio::io_context& ioc,
                 ArtifactRegistry& artifacts,
                 const StorageMover& storage,
                 EventSink& sink);

    RecallEngine(const RecallEngine&) = delete;
    RecallEngine& operator=(const RecallEngine&) = delete;

    // Schedules the TTL timer if the artifact is live and has an expiry.
    void arm(const std::string& id);

    RecallStatus recall(const std::string& id, RecallTrigger trigger);

    // Owner-initiated; anyone else gets Forbidden and nothing changes.
    RecallStatus recall_by(const std::string& id,
                           const std::string& identity,
                           const std::string& client_id);

private:
    void on_timer(const std::string& id);

    boost::asio::io_context& ioc_;
    ArtifactRegistry& artifacts_;
    const StorageMover& storage_;
    EventSink& sink_;
};

} // namespace recallchat::chat
