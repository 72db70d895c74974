#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <coop/generator.hpp>
#include <coop/thread-event.hpp>

#include "config.hpp"
#include "event-queue.hpp"
#include "signaling-protocol.hpp"
#include "transport.hpp"

namespace pdrop {
namespace event {
struct SignalingOpened {};
struct SignalingMessage {
    std::string text;
};
struct SignalingClosed {};
struct SignalingFailed {
    std::string reason;
};
struct LocalDescription {
    SessionDescription description;
};
struct LocalCandidate {
    Candidate candidate;
};
struct TransportStateChanged {
    TransportState state;
};
struct ChannelAnnounced {
    std::shared_ptr<Channel> channel;
};
struct ChannelOpened {};
struct ChannelClosed {};
struct ChannelFailed {
    std::string reason;
};
struct ChannelText {
    std::string text;
};
struct ChannelBinary {
    std::vector<std::byte> data;
};
} // namespace event

using SessionEvent = std::variant<
    event::SignalingOpened,
    event::SignalingMessage,
    event::SignalingClosed,
    event::SignalingFailed,
    event::LocalDescription,
    event::LocalCandidate,
    event::TransportStateChanged,
    event::ChannelAnnounced,
    event::ChannelOpened,
    event::ChannelClosed,
    event::ChannelFailed,
    event::ChannelText,
    event::ChannelBinary>;

enum class SessionPhase {
    Idle,
    Connecting,
    Negotiating,
    Connected,
    // terminal
    PeerLeft,
    Error,
    Disconnected,
};

enum class Role {
    None,
    Initiator, // received peer-joined, creates the channel and the offer
    Answerer,  // received the offer
};

// drives one connection attempt from room join to an open data channel
// all handlers run on the thread calling process_events, other threads only post events
class PeerSession : public TransferLink {
  private:
    // declared first so that links being destroyed can still post
    coop::ThreadEvent        wakeup;
    EventQueue<SessionEvent> events;

    Config                         config;
    std::unique_ptr<SignalingLink> signaling;
    PeerTransportFactory           transport_factory;
    std::unique_ptr<PeerTransport> transport;
    std::shared_ptr<Channel>       channel;

    SessionPhase           phase = SessionPhase::Idle;
    Role                   role  = Role::None;
    std::string            room_id;
    bool                   remote_description_set = false;
    bool                   channel_opened         = false;
    std::vector<Candidate> pending_candidates; // received before the remote description

    auto set_phase(SessionPhase next) -> void;
    auto report(ErrorKind kind, std::string message) -> void;
    auto send_signaling(const proto::Envelope& envelope) -> bool;
    auto create_transport() -> bool;
    auto attach_channel(std::shared_ptr<Channel> ch) -> bool;
    auto apply_remote_description(const SessionDescription& desc) -> bool;
    auto apply_candidate(const Candidate& candidate) -> void;
    auto flush_pending_candidates() -> void;
    auto teardown() -> void;
    auto finish(SessionPhase terminal) -> void;

    auto handle_signaling_message(std::string_view text) -> void;
    auto handle_peer_joined() -> void;
    auto handle_offer(const SessionDescription& desc) -> void;
    auto handle_answer(const SessionDescription& desc) -> void;
    auto handle_remote_candidate(const Candidate& candidate) -> void;
    auto handle_server_error(const std::string& message) -> void;
    auto handle_local_description(const SessionDescription& desc) -> void;
    auto handle_transport_state(TransportState state) -> void;
    auto handle_event(SessionEvent& event) -> void;

  public:
    std::function<void(ConnectionState)>        on_state_changed = [](ConnectionState) {};
    // data channel is open, transfers may start
    std::function<void()>                       on_ready         = [] {};
    std::function<void(const Error&)>           on_error         = [](const Error&) {};
    std::function<void(std::string)>            on_text          = [](std::string) {};
    std::function<void(std::vector<std::byte>)> on_binary        = [](std::vector<std::byte>) {};

    auto connect(std::string_view room_id) -> bool;
    auto disconnect() -> void;

    // thread safe
    auto post(SessionEvent event) -> void;
    // handles queued events in order, returns the number of handled events
    auto process_events() -> size_t;
    // handles events as they arrive until the session reaches a terminal phase
    auto run() -> coop::Async<void>;

    auto get_phase() const -> SessionPhase;
    auto get_state() const -> ConnectionState;
    auto get_role() const -> Role;
    auto get_pending_candidate_count() const -> size_t;

    // TransferLink
    auto send_text(std::string_view text) -> bool override;
    auto send_binary(std::span<const std::byte> data) -> bool override;
    auto buffered_amount() const -> size_t override;
    auto is_connected() const -> bool override;

    PeerSession(Config config, std::unique_ptr<SignalingLink> signaling, PeerTransportFactory transport_factory);
    ~PeerSession();
};

auto to_connection_state(SessionPhase phase) -> ConnectionState;
auto is_terminal(SessionPhase phase) -> bool;
} // namespace pdrop
