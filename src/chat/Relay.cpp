#include "chat/Relay.h"

#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace recallchat::chat {

Relay::Relay(IDGenerator& idgen,
             RoomRegistry& rooms,
             ArtifactRegistry& artifacts,
             RecallEngine& engine,
             EventSink& sink)
    : idgen_(idgen), rooms_(rooms), artifacts_(artifacts), engine_(engine), sink_(sink) {}

Result<Member> Relay::connect(ConnectionId connection,
                              const std::string& identity,
                              const std::string& room,
                              EventSink::Deliver deliver) {
    Member member{connection, idgen_.clientID(), identity, room};

    JoinResult joined = rooms_.join(member);
    if (!joined.accepted) {
        std::cout << "[Relay] " << identity << " rejected: room " << member.room() << " is full\n";
        return make_error(ErrorCategory::RoomFull, "room is full");
    }

    sink_.attach(member, std::move(deliver));

    sink_.send_direct(connection, Welcome{member.client_id(), member.identity(), member.room(),
                                          member_views(joined.members)});
    sink_.publish(member.room(), Outbound{Presence{member.room(), member_views(joined.members)}});

    std::cout << "[Relay] " << member.client_id() << " (" << identity << ") joined " << member.room()
              << " [" << joined.members.size() << "/" << RoomRegistry::kCapacity << "]\n";
    return member;
}

void Relay::disconnect(ConnectionId connection) {
    sink_.detach(connection);

    auto left = rooms_.leave(connection);
    if (!left) return;

    if (left->room_deleted) {
        sink_.close_room(left->room);
        std::cout << "[Relay] room " << left->room << " closed\n";
        return;
    }
    sink_.publish(left->room, Outbound{Presence{left->room, member_views(left->remaining)}});
}

void Relay::handle_message(ConnectionId connection, std::string_view frame) {
    auto member = rooms_.find(connection);
    if (!member) return;

    auto msg = parse_client_message(frame);
    if (!msg) return;

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ChatRequest>) {
            on_chat(*member, m);
        } else if constexpr (std::is_same_v<T, RecallRequest>) {
            on_recall(*member, m);
        } else {
            on_name(*member, m);
        }
    }, *msg);
}

void Relay::on_chat(const Member& member, const ChatRequest& req) {
    artifacts_.create_chat(member.room(), Owner{member.identity(), member.client_id()}, req.text,
        [&](const Artifact& a) {
            sink_.publish(a.room, Outbound{ChatPosted{a.id, member.identity(), member.name(),
                                                      a.text, to_epoch_ms(a.created_at)}});
        });
}

void Relay::on_recall(const Member& member, const RecallRequest& req) {
    switch (engine_.recall_by(req.id, member.identity(), member.client_id())) {
        case RecallStatus::Recalled:
        case RecallStatus::AlreadyRecalled:
            break;
        case RecallStatus::NotFound:
            sink_.send_direct(member.connection(),
                              Failure{ErrorCategory::NotFound, "unknown item", req.id});
            break;
        case RecallStatus::Forbidden:
            sink_.send_direct(member.connection(),
                              Failure{ErrorCategory::Forbidden, "only the sender can recall", req.id});
            break;
    }
}

void Relay::on_name(const Member& member, const NameRequest& req) {
    auto members = rooms_.rename(member.connection(), req.name);
    if (!members) return;
    sink_.publish(member.room(), Outbound{Presence{member.room(), member_views(*members)}});
}

Result<UploadReceipt> Relay::upload(const UploadRequest& request) {
    const std::string room = Member::normalize_room(request.room);
    if (!is_member(room, request.identity, request.client_id)) {
        return make_error(ErrorCategory::Forbidden, "not a member of this room");
    }
    const Owner owner{request.identity, request.client_id};

    Result<Artifact> created = make_error(ErrorCategory::Storage, "upload failed");
    try {
        created = artifacts_.create_file(
            room, owner,
            FileUpload{request.name, request.mime_type, request.bytes},
            request.ttl_seconds, request.password, request.view_only,
            [&](const Artifact& a) {
                FileAvailable evt;
                evt.id = a.id;
                evt.from = owner.identity;
                evt.name = a.name;
                evt.size = a.size;
                evt.mime = a.mime_type;
                evt.is_protected = a.is_protected;
                evt.view_only = a.view_only;
                if (a.expires_at) evt.expires_at = to_epoch_ms(*a.expires_at);
                if (a.public_path) evt.url = public_url(a.id);
                evt.timestamp = to_epoch_ms(a.created_at);
                sink_.publish(a.room, Outbound{evt});
            });
    } catch (const std::runtime_error& e) {
        std::cerr << "[Relay] upload failed: " << e.what() << "\n";
        return make_error(ErrorCategory::Storage, "upload failed");
    }

    auto* artifact = std::get_if<Artifact>(&created);
    if (!artifact) return std::get<Error>(created);

    engine_.arm(artifact->id);

    UploadReceipt receipt;
    receipt.id = artifact->id;
    receipt.room = room;
    if (artifact->public_path) receipt.url = public_url(artifact->id);
    receipt.owner_url = owner_url(artifact->id);
    if (artifact->expires_at) receipt.expires_at = to_epoch_ms(*artifact->expires_at);

    std::cout << "[Relay] " << artifact->id << " uploaded to " << room << " (" << artifact->size
              << " bytes" << (artifact->is_protected ? ", protected" : "")
              << (artifact->view_only ? ", view-only" : "") << ")\n";
    return receipt;
}

std::string Relay::verified_session(const std::string& identity, const std::string& client_id) const {
    auto member = rooms_.find_session(client_id);
    if (!member || member->identity() != identity) return {};
    return client_id;
}

bool Relay::is_member(const std::string& room, const std::string& identity, const std::string& client_id) const {
    auto member = rooms_.find_session(client_id);
    return member && member->identity() == identity && member->room() == room;
}

} // namespace recallchat::chat
