#pragma once
#include <memory>
#include <string>

#include <rtc/rtc.hpp>

#include "config.hpp"
#include "transport.hpp"

// libdatachannel backed transports
namespace pdrop {
class RtcChannel : public Channel {
  private:
    std::shared_ptr<rtc::DataChannel> dc;

  public:
    auto start() -> void override;
    auto send_text(std::string_view text) -> bool override;
    auto send_binary(std::span<const std::byte> data) -> bool override;
    auto buffered_amount() const -> size_t override;
    auto is_open() const -> bool override;
    auto close() -> void override;

    RtcChannel(std::shared_ptr<rtc::DataChannel> dc);
    ~RtcChannel();
};

class RtcPeerTransport : public PeerTransport {
  private:
    std::shared_ptr<rtc::PeerConnection> pc;

  public:
    auto create_channel(std::string_view label) -> std::shared_ptr<Channel> override;
    auto generate_offer() -> bool override;
    auto generate_answer() -> bool override;
    auto apply_remote_description(const SessionDescription& desc) -> bool override;
    auto add_remote_candidate(const Candidate& candidate) -> bool override;
    auto close() -> void override;

    auto init(const Config& config) -> bool;

    ~RtcPeerTransport();
};

class RtcSignalingLink : public SignalingLink {
  private:
    std::string                       url;
    std::shared_ptr<rtc::WebSocket> ws;

  public:
    auto open() -> bool override;
    auto send(std::string_view text) -> bool override;
    auto close() -> void override;

    RtcSignalingLink(std::string url);
    ~RtcSignalingLink();
};

auto create_rtc_transport(const Config& config) -> std::unique_ptr<PeerTransport>;
auto init_rtc_logger(bool verbose) -> void;
} // namespace pdrop
