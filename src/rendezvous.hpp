#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "room-registry.hpp"
#include "signaling-protocol.hpp"

namespace pdrop {
struct RendezvousService;

// one per connected endpoint
struct RendezvousSession {
    RendezvousService*         service;
    std::string                endpoint_id;
    std::shared_ptr<Endpoint>  endpoint;
    std::optional<std::string> room_id;
    std::mutex                 lock;

    auto send(const proto::Envelope& envelope) -> bool;
    auto reject(int error) -> bool;
    auto handle_join(const proto::Join& request) -> bool;
    auto handle_relay(std::string_view tag, std::string_view text) -> bool;
    auto handle_payload(std::string_view text) -> bool;
};

struct RendezvousService {
    RoomRegistry& registry;

    auto alloc_session(std::shared_ptr<Endpoint> endpoint) -> RendezvousSession*;
    // notifies the other endpoint of the room, then drops the membership
    auto free_session(RendezvousSession* ptr) -> void;
    auto on_received(RendezvousSession& session, std::string_view text) -> void;

    RendezvousService(RoomRegistry& registry);
};
} // namespace pdrop
