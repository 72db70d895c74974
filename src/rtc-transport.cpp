#include "rtc-transport.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_rtc");
}

namespace pdrop {
namespace {
auto convert_state(const rtc::PeerConnection::State state) -> TransportState {
    switch(state) {
    case rtc::PeerConnection::State::New:
        return TransportState::New;
    case rtc::PeerConnection::State::Connecting:
        return TransportState::Connecting;
    case rtc::PeerConnection::State::Connected:
        return TransportState::Connected;
    case rtc::PeerConnection::State::Disconnected:
        return TransportState::Disconnected;
    case rtc::PeerConnection::State::Failed:
        return TransportState::Failed;
    case rtc::PeerConnection::State::Closed:
        return TransportState::Closed;
    }
    return TransportState::Failed;
}
} // namespace

// RtcChannel
auto RtcChannel::send_text(const std::string_view text) -> bool {
    try {
        return dc->send(std::string(text));
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to send text frame: {}", e.what());
        return false;
    }
}

auto RtcChannel::send_binary(const std::span<const std::byte> data) -> bool {
    try {
        return dc->send(data.data(), data.size());
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to send binary frame: {}", e.what());
        return false;
    }
}

auto RtcChannel::buffered_amount() const -> size_t {
    return dc->bufferedAmount();
}

auto RtcChannel::is_open() const -> bool {
    return dc->isOpen();
}

auto RtcChannel::close() -> void {
    dc->resetCallbacks();
    dc->close();
}

// libdatachannel holds incoming messages until onMessage is set
auto RtcChannel::start() -> void {
    dc->onOpen([this] { on_open(); });
    dc->onClosed([this] { on_closed(); });
    dc->onError([this](std::string error) { on_error(error); });
    dc->onMessage([this](rtc::message_variant message) {
        if(auto text = std::get_if<rtc::string>(&message)) {
            on_text(std::move(*text));
        } else {
            on_binary(std::move(std::get<rtc::binary>(message)));
        }
    });
}

RtcChannel::RtcChannel(std::shared_ptr<rtc::DataChannel> channel)
    : dc(std::move(channel)) {}

RtcChannel::~RtcChannel() {
    dc->resetCallbacks();
}

// RtcPeerTransport
auto RtcPeerTransport::create_channel(const std::string_view label) -> std::shared_ptr<Channel> {
    try {
        return std::make_shared<RtcChannel>(pc->createDataChannel(std::string(label)));
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to create data channel: {}", e.what());
        return nullptr;
    }
}

auto RtcPeerTransport::generate_offer() -> bool {
    try {
        pc->setLocalDescription(rtc::Description::Type::Offer);
        return true;
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to create offer: {}", e.what());
        return false;
    }
}

auto RtcPeerTransport::generate_answer() -> bool {
    try {
        pc->setLocalDescription(rtc::Description::Type::Answer);
        return true;
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to create answer: {}", e.what());
        return false;
    }
}

auto RtcPeerTransport::apply_remote_description(const SessionDescription& desc) -> bool {
    try {
        pc->setRemoteDescription(rtc::Description(desc.sdp, std::string(to_string(desc.kind))));
        return true;
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to apply remote description: {}", e.what());
        return false;
    }
}

auto RtcPeerTransport::add_remote_candidate(const Candidate& candidate) -> bool {
    try {
        pc->addRemoteCandidate(rtc::Candidate(candidate.candidate, resolve_candidate_mid(candidate)));
        return true;
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to add remote candidate: {}", e.what());
        return false;
    }
}

auto RtcPeerTransport::close() -> void {
    if(!pc) {
        return;
    }
    pc->resetCallbacks();
    pc->close();
}

auto RtcPeerTransport::init(const Config& config) -> bool {
    auto rtc_config = rtc::Configuration();
    for(const auto& server : config.ice_servers) {
        for(const auto& url : server.urls) {
            auto ice_server = rtc::IceServer(url);
            if(!server.username.empty()) {
                ice_server.username = server.username;
                ice_server.password = server.credential;
            }
            rtc_config.iceServers.emplace_back(std::move(ice_server));
        }
    }
    // descriptions are generated when the session asks for them
    rtc_config.disableAutoNegotiation = true;
    try {
        pc = std::make_shared<rtc::PeerConnection>(rtc_config);
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to create peer connection: {}", e.what());
        return false;
    }

    pc->onLocalDescription([this](rtc::Description desc) {
        const auto kind = parse_description_kind(desc.typeString());
        if(!kind) {
            LOG_WARN(logger, "unknown local description type {}", desc.typeString());
            return;
        }
        on_local_description(SessionDescription{*kind, std::string(desc)});
    });
    pc->onLocalCandidate([this](rtc::Candidate candidate) {
        auto line = candidate.candidate();
        auto ufrag = find_candidate_ufrag(line);
        // the m-line index is not exposed, the mid identifies the section
        on_local_candidate(Candidate{
            .candidate         = std::move(line),
            .sdp_mid           = candidate.mid(),
            .sdp_mline_index   = std::nullopt,
            .username_fragment = std::move(ufrag),
        });
    });
    pc->onStateChange([this](rtc::PeerConnection::State state) { on_state_changed(convert_state(state)); });
    pc->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) { on_channel(std::make_shared<RtcChannel>(std::move(dc))); });
    return true;
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

// RtcSignalingLink
auto RtcSignalingLink::open() -> bool {
    ws = std::make_shared<rtc::WebSocket>();
    ws->onOpen([this] { on_open(); });
    ws->onClosed([this] { on_closed(); });
    ws->onError([this](std::string error) { on_error(error); });
    ws->onMessage([this](rtc::message_variant message) {
        if(auto text = std::get_if<rtc::string>(&message)) {
            on_message(std::move(*text));
        } else {
            LOG_WARN(logger, "dropping binary frame from rendezvous server");
        }
    });
    LOG_INFO(logger, "connecting to {}", url);
    try {
        ws->open(url);
        return true;
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to open {}: {}", url, e.what());
        return false;
    }
}

auto RtcSignalingLink::send(const std::string_view text) -> bool {
    ensure(ws && ws->isOpen(), "websocket is not open");
    try {
        return ws->send(std::string(text));
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to send signaling message: {}", e.what());
        return false;
    }
}

auto RtcSignalingLink::close() -> void {
    if(!ws) {
        return;
    }
    ws->resetCallbacks();
    ws->close();
}

RtcSignalingLink::RtcSignalingLink(std::string url)
    : url(std::move(url)) {}

RtcSignalingLink::~RtcSignalingLink() {
    close();
}

auto create_rtc_transport(const Config& config) -> std::unique_ptr<PeerTransport> {
    auto transport = std::make_unique<RtcPeerTransport>();
    ensure(transport->init(config));
    return transport;
}

auto init_rtc_logger(const bool verbose) -> void {
    rtc::InitLogger(verbose ? rtc::LogLevel::Debug : rtc::LogLevel::Warning);
}
} // namespace pdrop
