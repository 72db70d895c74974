#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "protocol.hpp"

namespace pdrop {
// reliable, ordered, binary capable duplex channel negotiated between the peers
// callbacks may be invoked from any thread once start is called
// they must all be assigned before that, frames arriving earlier are held back
class Channel {
  public:
    std::function<void()>                       on_open   = [] {};
    std::function<void()>                       on_closed = [] {};
    std::function<void(std::string_view)>       on_error  = [](std::string_view) {};
    std::function<void(std::string)>            on_text   = [](std::string) {};
    std::function<void(std::vector<std::byte>)> on_binary = [](std::vector<std::byte>) {};

    virtual auto start() -> void                                      = 0;
    virtual auto send_text(std::string_view text) -> bool             = 0;
    virtual auto send_binary(std::span<const std::byte> data) -> bool = 0;
    // bytes queued locally but not yet handed to the network
    virtual auto buffered_amount() const -> size_t = 0;
    virtual auto is_open() const -> bool           = 0;
    virtual auto close() -> void                   = 0;

    virtual ~Channel() {}
};

enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

// local end of the peer connection
// descriptions and candidates are produced asynchronously through the callbacks
class PeerTransport {
  public:
    std::function<void(SessionDescription)>       on_local_description = [](SessionDescription) {};
    std::function<void(Candidate)>                on_local_candidate   = [](Candidate) {};
    std::function<void(TransportState)>           on_state_changed     = [](TransportState) {};
    // inbound channel announced by the remote peer
    std::function<void(std::shared_ptr<Channel>)> on_channel           = [](std::shared_ptr<Channel>) {};

    virtual auto create_channel(std::string_view label) -> std::shared_ptr<Channel> = 0;
    virtual auto generate_offer() -> bool                                           = 0;
    virtual auto generate_answer() -> bool                                          = 0;
    virtual auto apply_remote_description(const SessionDescription& desc) -> bool   = 0;
    virtual auto add_remote_candidate(const Candidate& candidate) -> bool           = 0;
    virtual auto close() -> void                                                    = 0;

    virtual ~PeerTransport() {}
};

using PeerTransportFactory = std::function<std::unique_ptr<PeerTransport>(const Config& config)>;

// what the transfer engine needs from an established session
class TransferLink {
  public:
    virtual auto send_text(std::string_view text) -> bool             = 0;
    virtual auto send_binary(std::span<const std::byte> data) -> bool = 0;
    virtual auto buffered_amount() const -> size_t                    = 0;
    virtual auto is_connected() const -> bool                         = 0;

    virtual ~TransferLink() {}
};

// message connection to the rendezvous server
class SignalingLink {
  public:
    std::function<void()>                 on_open    = [] {};
    std::function<void()>                 on_closed  = [] {};
    std::function<void(std::string_view)> on_error   = [](std::string_view) {};
    std::function<void(std::string)>      on_message = [](std::string) {};

    virtual auto open() -> bool                      = 0;
    virtual auto send(std::string_view text) -> bool = 0;
    virtual auto close() -> void                     = 0;

    virtual ~SignalingLink() {}
};
} // namespace pdrop
