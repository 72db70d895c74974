#include <coop/promise.hpp>

#include "macros/logger.hpp"
#include "overloaded.hpp"
#include "peer-session.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_session");
}

namespace pdrop {
namespace {
constexpr auto channel_label = "file";
} // namespace

auto to_connection_state(const SessionPhase phase) -> ConnectionState {
    switch(phase) {
    case SessionPhase::Idle:
    case SessionPhase::Disconnected:
        return ConnectionState::Disconnected;
    case SessionPhase::Connecting:
    case SessionPhase::Negotiating:
        return ConnectionState::Connecting;
    case SessionPhase::Connected:
        return ConnectionState::Connected;
    case SessionPhase::PeerLeft:
        return ConnectionState::PeerLeft;
    case SessionPhase::Error:
        return ConnectionState::Error;
    }
    return ConnectionState::Error;
}

auto is_terminal(const SessionPhase phase) -> bool {
    return phase == SessionPhase::PeerLeft || phase == SessionPhase::Error || phase == SessionPhase::Disconnected;
}

auto PeerSession::set_phase(const SessionPhase next) -> void {
    if(phase == next) {
        return;
    }
    const auto prev_state = to_connection_state(phase);
    LOG_DEBUG(logger, "phase {} -> {}", int(phase), int(next));
    phase = next;
    if(const auto state = to_connection_state(next); state != prev_state) {
        LOG_INFO(logger, "connection state: {}", to_string(state));
        on_state_changed(state);
    }
}

auto PeerSession::report(const ErrorKind kind, std::string message) -> void {
    LOG_ERROR(logger, "{}", message);
    on_error(Error{kind, std::move(message)});
}

auto PeerSession::send_signaling(const proto::Envelope& envelope) -> bool {
    ensure(signaling->send(proto::dump_envelope(envelope)), "failed to send {} to rendezvous server", proto::tag_of(envelope));
    return true;
}

auto PeerSession::create_transport() -> bool {
    transport = transport_factory(config);
    ensure(transport, "failed to create peer transport");

    transport->on_local_description = [this](SessionDescription desc) { post(event::LocalDescription{std::move(desc)}); };
    transport->on_local_candidate   = [this](Candidate candidate) { post(event::LocalCandidate{std::move(candidate)}); };
    transport->on_state_changed     = [this](TransportState state) { post(event::TransportStateChanged{state}); };
    transport->on_channel           = [this](std::shared_ptr<Channel> ch) { post(event::ChannelAnnounced{std::move(ch)}); };
    return true;
}

auto PeerSession::attach_channel(std::shared_ptr<Channel> ch) -> bool {
    ensure(ch, "no data channel to attach");
    channel            = std::move(ch);
    channel->on_open   = [this] { post(event::ChannelOpened()); };
    channel->on_closed = [this] { post(event::ChannelClosed()); };
    channel->on_error  = [this](std::string_view reason) { post(event::ChannelFailed{std::string(reason)}); };
    channel->on_text   = [this](std::string text) { post(event::ChannelText{std::move(text)}); };
    channel->on_binary = [this](std::vector<std::byte> data) { post(event::ChannelBinary{std::move(data)}); };
    channel->start();
    // the open notification may have fired before start
    if(channel->is_open()) {
        post(event::ChannelOpened());
    }
    return true;
}

auto PeerSession::apply_remote_description(const SessionDescription& desc) -> bool {
    ensure(transport->apply_remote_description(desc), "failed to apply remote {}", to_string(desc.kind));
    remote_description_set = true;
    flush_pending_candidates();
    return true;
}

auto PeerSession::apply_candidate(const Candidate& candidate) -> void {
    // a single bad candidate does not break the session, other paths may still work
    if(!transport->add_remote_candidate(candidate)) {
        LOG_WARN(logger, "failed to add remote candidate {}", candidate.candidate);
    }
}

auto PeerSession::flush_pending_candidates() -> void {
    if(!pending_candidates.empty()) {
        LOG_DEBUG(logger, "applying {} queued candidates", pending_candidates.size());
    }
    for(const auto& candidate : pending_candidates) {
        apply_candidate(candidate);
    }
    pending_candidates.clear();
}

auto PeerSession::teardown() -> void {
    if(channel) {
        channel->close();
        channel.reset();
    }
    if(transport) {
        transport->close();
        transport.reset();
    }
    pending_candidates.clear();
    // closing after the transport lets queued outbound messages flush first
    signaling->close();
}

auto PeerSession::finish(const SessionPhase terminal) -> void {
    if(is_terminal(phase)) {
        return;
    }
    set_phase(terminal);
    teardown();
}

auto PeerSession::handle_peer_joined() -> void {
    if(role != Role::None || phase != SessionPhase::Connecting) {
        LOG_WARN(logger, "ignoring peer-joined in the middle of negotiation");
        return;
    }
    LOG_INFO(logger, "peer joined, becoming initiator");
    role = Role::Initiator;
    if(!create_transport()) {
        report(ErrorKind::Transport, "Failed to create peer connection");
        finish(SessionPhase::Error);
        return;
    }
    if(!attach_channel(transport->create_channel(channel_label))) {
        report(ErrorKind::Transport, "Failed to create data channel");
        finish(SessionPhase::Error);
        return;
    }
    if(!transport->generate_offer()) {
        report(ErrorKind::Negotiation, "Failed to create offer");
        return;
    }
    set_phase(SessionPhase::Negotiating);
}

auto PeerSession::handle_offer(const SessionDescription& desc) -> void {
    if(role != Role::None) {
        report(ErrorKind::Negotiation, "Unexpected offer");
        return;
    }
    LOG_INFO(logger, "received offer, becoming answerer");
    role = Role::Answerer;
    if(!create_transport()) {
        report(ErrorKind::Transport, "Failed to create peer connection");
        finish(SessionPhase::Error);
        return;
    }
    if(!apply_remote_description(desc) || !transport->generate_answer()) {
        report(ErrorKind::Negotiation, "Failed to handle offer");
        return;
    }
    set_phase(SessionPhase::Negotiating);
}

auto PeerSession::handle_answer(const SessionDescription& desc) -> void {
    if(role != Role::Initiator || !transport) {
        report(ErrorKind::Negotiation, "Unexpected answer");
        return;
    }
    LOG_INFO(logger, "received answer");
    if(!apply_remote_description(desc)) {
        report(ErrorKind::Negotiation, "Failed to handle answer");
    }
}

auto PeerSession::handle_remote_candidate(const Candidate& candidate) -> void {
    if(!transport || !remote_description_set) {
        LOG_DEBUG(logger, "queueing early candidate");
        pending_candidates.push_back(candidate);
        return;
    }
    apply_candidate(candidate);
}

auto PeerSession::handle_server_error(const std::string& message) -> void {
    report(ErrorKind::Signaling, message);
    // a rejected join leaves nothing to negotiate with
    if(phase == SessionPhase::Connecting && role == Role::None) {
        finish(SessionPhase::Error);
    }
}

auto PeerSession::handle_signaling_message(const std::string_view text) -> void {
    const auto envelope = proto::parse_envelope(text);
    if(!envelope) {
        report(ErrorKind::Signaling, "Failed to process signaling message");
        return;
    }
    LOG_DEBUG(logger, "received signaling message {}", proto::tag_of(*envelope));
    std::visit(Overloaded{
                   [](const proto::Join&) { LOG_WARN(logger, "ignoring join from server"); },
                   [this](const proto::Offer& msg) { handle_offer(msg.description); },
                   [this](const proto::Answer& msg) { handle_answer(msg.description); },
                   [this](const proto::IceCandidate& msg) { handle_remote_candidate(msg.candidate); },
                   [this](const proto::PeerJoined&) { handle_peer_joined(); },
                   [this](const proto::PeerLeft&) {
                       LOG_INFO(logger, "peer left");
                       finish(SessionPhase::PeerLeft);
                   },
                   [this](const proto::Error& msg) { handle_server_error(msg.message); },
               },
               *envelope);
}

auto PeerSession::handle_local_description(const SessionDescription& desc) -> void {
    switch(desc.kind) {
    case DescriptionKind::Offer:
        LOG_DEBUG(logger, "sending offer");
        send_signaling(proto::Offer{desc});
        break;
    case DescriptionKind::Answer:
        LOG_DEBUG(logger, "sending answer");
        send_signaling(proto::Answer{desc});
        break;
    default:
        LOG_WARN(logger, "not sending local {}", to_string(desc.kind));
        break;
    }
}

auto PeerSession::handle_transport_state(const TransportState state) -> void {
    switch(state) {
    case TransportState::Connected:
        set_phase(SessionPhase::Connected);
        break;
    case TransportState::Disconnected:
    case TransportState::Failed:
        report(ErrorKind::Transport, "Peer connection failed");
        finish(SessionPhase::Error);
        break;
    case TransportState::Closed:
        finish(SessionPhase::Disconnected);
        break;
    default:
        break;
    }
}

auto PeerSession::handle_event(SessionEvent& event) -> void {
    // late events from torn down links
    if(is_terminal(phase)) {
        return;
    }
    std::visit(Overloaded{
                   [this](event::SignalingOpened&) {
                       LOG_INFO(logger, "signaling connected, joining room {}", room_id);
                       if(!send_signaling(proto::Join{room_id})) {
                           finish(SessionPhase::Error);
                       }
                   },
                   [this](event::SignalingMessage& e) { handle_signaling_message(e.text); },
                   [this](event::SignalingClosed&) {
                       LOG_INFO(logger, "signaling closed");
                       finish(SessionPhase::Disconnected);
                   },
                   [this](event::SignalingFailed& e) {
                       report(ErrorKind::Signaling, "WebSocket connection error: " + e.reason);
                       finish(SessionPhase::Error);
                   },
                   [this](event::LocalDescription& e) { handle_local_description(e.description); },
                   [this](event::LocalCandidate& e) { send_signaling(proto::IceCandidate{std::move(e.candidate)}); },
                   [this](event::TransportStateChanged& e) { handle_transport_state(e.state); },
                   [this](event::ChannelAnnounced& e) {
                       if(role != Role::Answerer || channel) {
                           LOG_WARN(logger, "ignoring unexpected channel");
                           return;
                       }
                       LOG_INFO(logger, "inbound channel announced");
                       attach_channel(std::move(e.channel));
                   },
                   [this](event::ChannelOpened&) {
                       if(channel_opened) {
                           return;
                       }
                       channel_opened = true;
                       LOG_INFO(logger, "channel opened");
                       set_phase(SessionPhase::Connected);
                       on_ready();
                   },
                   [this](event::ChannelClosed&) {
                       LOG_INFO(logger, "channel closed");
                       finish(SessionPhase::Disconnected);
                   },
                   [this](event::ChannelFailed& e) { report(ErrorKind::Transport, "Data channel error: " + e.reason); },
                   [this](event::ChannelText& e) { on_text(std::move(e.text)); },
                   [this](event::ChannelBinary& e) { on_binary(std::move(e.data)); },
               },
               event);
}

auto PeerSession::connect(const std::string_view room) -> bool {
    ensure(phase == SessionPhase::Idle, "session already started");
    room_id = std::string(room);

    signaling->on_open    = [this] { post(event::SignalingOpened()); };
    signaling->on_closed  = [this] { post(event::SignalingClosed()); };
    signaling->on_error   = [this](std::string_view reason) { post(event::SignalingFailed{std::string(reason)}); };
    signaling->on_message = [this](std::string text) { post(event::SignalingMessage{std::move(text)}); };

    set_phase(SessionPhase::Connecting);
    if(!signaling->open()) {
        report(ErrorKind::Signaling, "Failed to connect to rendezvous server");
        finish(SessionPhase::Error);
        return false;
    }
    return true;
}

auto PeerSession::disconnect() -> void {
    if(phase == SessionPhase::Idle) {
        set_phase(SessionPhase::Disconnected);
        return;
    }
    finish(SessionPhase::Disconnected);
    wakeup.notify();
}

auto PeerSession::post(SessionEvent event) -> void {
    events.push(std::move(event));
}

auto PeerSession::process_events() -> size_t {
    auto count = size_t(0);
    while(auto event = events.pop()) {
        handle_event(*event);
        count += 1;
    }
    return count;
}

auto PeerSession::run() -> coop::Async<void> {
    while(true) {
        process_events();
        if(is_terminal(phase)) {
            co_return;
        }
        co_await wakeup;
    }
}

auto PeerSession::get_phase() const -> SessionPhase {
    return phase;
}

auto PeerSession::get_state() const -> ConnectionState {
    return to_connection_state(phase);
}

auto PeerSession::get_role() const -> Role {
    return role;
}

auto PeerSession::get_pending_candidate_count() const -> size_t {
    return pending_candidates.size();
}

auto PeerSession::send_text(const std::string_view text) -> bool {
    ensure(is_connected(), "channel is not open");
    return channel->send_text(text);
}

auto PeerSession::send_binary(const std::span<const std::byte> data) -> bool {
    ensure(is_connected(), "channel is not open");
    return channel->send_binary(data);
}

auto PeerSession::buffered_amount() const -> size_t {
    return channel ? channel->buffered_amount() : 0;
}

auto PeerSession::is_connected() const -> bool {
    return phase == SessionPhase::Connected && channel != nullptr && channel->is_open();
}

PeerSession::PeerSession(Config config, std::unique_ptr<SignalingLink> signaling, PeerTransportFactory transport_factory)
    : config(std::move(config)),
      signaling(std::move(signaling)),
      transport_factory(std::move(transport_factory)) {
    events.on_pushed = [this] { wakeup.notify(); };
}

PeerSession::~PeerSession() {
    events.drain();
    if(!is_terminal(phase) && phase != SessionPhase::Idle) {
        teardown();
    }
}
} // namespace pdrop
