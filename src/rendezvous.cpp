#include <array>

#include "macros/logger.hpp"
#include "rendezvous.hpp"

namespace {
auto logger = Logger("pdrop_rendezvous");
}

namespace pdrop {
namespace {
struct Failure {
    enum {
        InvalidFormat = 0,
        RoomUnavailable,
        NotInRoom,
        NoPeer,

        Limit,
    };
};

const auto estr = std::array{
    "Invalid message format",      // InvalidFormat
    "Room is full or unavailable", // RoomUnavailable
    "Not in a room",               // NotInRoom
    "No peer connected",           // NoPeer
};

static_assert(Failure::Limit == estr.size());

// a room may disappear between lookup and join when its last endpoint leaves
constexpr auto join_attempts = 2;
} // namespace

auto RendezvousSession::send(const proto::Envelope& envelope) -> bool {
    if(!endpoint->is_open()) {
        return false;
    }
    return endpoint->send(proto::dump_envelope(envelope));
}

auto RendezvousSession::reject(const int error) -> bool {
    LOG_WARN(logger, "endpoint {}: {}", endpoint_id, estr[error]);
    send(proto::Error{estr[error]});
    return false;
}

auto RendezvousSession::handle_join(const proto::Join& request) -> bool {
    auto& registry = service->registry;

    LOG_INFO(logger, "received join request endpoint={} room={}", endpoint_id, request.room_id);
    if(room_id) {
        return reject(Failure::RoomUnavailable);
    }

    auto result = JoinResult::Missing;
    for(auto i = 0; i < join_attempts && result == JoinResult::Missing; i += 1) {
        registry.create_or_get(request.room_id);
        result = registry.join(request.room_id, endpoint_id, endpoint);
    }
    if(result != JoinResult::Joined) {
        return reject(Failure::RoomUnavailable);
    }
    room_id = request.room_id;

    if(const auto other = registry.other_endpoint(*room_id, endpoint_id); other && other->is_open()) {
        LOG_INFO(logger, "notifying peer in room {} of new join", *room_id);
        other->send(proto::dump_envelope(proto::PeerJoined()));
    }
    return true;
}

auto RendezvousSession::handle_relay(const std::string_view tag, const std::string_view text) -> bool {
    if(!room_id) {
        return reject(Failure::NotInRoom);
    }
    const auto other = service->registry.other_endpoint(*room_id, endpoint_id);
    if(!other || !other->is_open() || !other->send(text)) {
        return reject(Failure::NoPeer);
    }
    LOG_DEBUG(logger, "forwarded {} in room {}", tag, *room_id);
    return true;
}

auto RendezvousSession::handle_payload(const std::string_view text) -> bool {
    const auto envelope = proto::parse_envelope(text);
    if(!envelope) {
        return reject(Failure::InvalidFormat);
    }
    const auto tag = proto::tag_of(*envelope);
    LOG_DEBUG(logger, "message from {}: {}", endpoint_id, tag);

    struct Visitor {
        RendezvousSession& self;
        std::string_view   tag;
        std::string_view   text;

        auto operator()(const proto::Join& msg) -> bool {
            return self.handle_join(msg);
        }
        auto operator()(const proto::Offer&) -> bool {
            return self.handle_relay(tag, text);
        }
        auto operator()(const proto::Answer&) -> bool {
            return self.handle_relay(tag, text);
        }
        auto operator()(const proto::IceCandidate&) -> bool {
            return self.handle_relay(tag, text);
        }
        // server to endpoint only
        auto operator()(const proto::PeerJoined&) -> bool {
            return self.reject(Failure::InvalidFormat);
        }
        auto operator()(const proto::PeerLeft&) -> bool {
            return self.reject(Failure::InvalidFormat);
        }
        auto operator()(const proto::Error&) -> bool {
            return self.reject(Failure::InvalidFormat);
        }
    };
    return std::visit(Visitor{*this, tag, text}, *envelope);
}

auto RendezvousService::alloc_session(std::shared_ptr<Endpoint> endpoint) -> RendezvousSession* {
    auto& session       = *(new RendezvousSession());
    session.service     = this;
    session.endpoint_id = generate_id();
    session.endpoint    = std::move(endpoint);
    LOG_INFO(logger, "endpoint connected {}", session.endpoint_id);
    return &session;
}

auto RendezvousService::free_session(RendezvousSession* const ptr) -> void {
    auto& session = *ptr;
    {
        auto guard = std::lock_guard(session.lock);
        LOG_INFO(logger, "endpoint disconnected {}", session.endpoint_id);
        if(session.room_id) {
            const auto& room_id = *session.room_id;
            if(const auto other = registry.other_endpoint(room_id, session.endpoint_id); other && other->is_open()) {
                other->send(proto::dump_envelope(proto::PeerLeft()));
                LOG_INFO(logger, "notified peer in room {} of disconnect", room_id);
            }
            registry.leave(room_id, session.endpoint_id);
        }
    }
    delete &session;
}

auto RendezvousService::on_received(RendezvousSession& session, const std::string_view text) -> void {
    auto guard = std::lock_guard(session.lock);
    if(!session.handle_payload(text)) {
        LOG_DEBUG(logger, "payload handling failed endpoint={}", session.endpoint_id);
    }
}

RendezvousService::RendezvousService(RoomRegistry& registry)
    : registry(registry) {}
} // namespace pdrop
