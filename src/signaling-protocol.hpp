#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "protocol.hpp"

// endpoint <-> (rendezvous server) <-> endpoint
// every message is a json text frame tagged by "type"
namespace pdrop::proto {
// server <- endpoint  enter a room, creating it when unseen
struct Join {
    std::string room_id;
};

// server <-> endpoint relayed verbatim to the other endpoint
struct Offer {
    SessionDescription description;
};

// server <-> endpoint relayed verbatim to the other endpoint
struct Answer {
    SessionDescription description;
};

// server <-> endpoint relayed verbatim to the other endpoint
struct IceCandidate {
    Candidate candidate;
};

// server  -> endpoint another endpoint entered the room, receiver becomes the initiator
struct PeerJoined {};

// server  -> endpoint the other endpoint disconnected
struct PeerLeft {};

// server  -> endpoint request failed
struct Error {
    std::string message;
};

using Envelope = std::variant<Join, Offer, Answer, IceCandidate, PeerJoined, PeerLeft, Error>;

auto tag_of(const Envelope& envelope) -> std::string_view;
auto parse_envelope(std::string_view text) -> std::optional<Envelope>;
auto dump_envelope(const Envelope& envelope) -> std::string;
} // namespace pdrop::proto
