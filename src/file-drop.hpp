#pragma once
#include <memory>
#include <string_view>
#include <vector>

#include <coop/generator.hpp>
#include <coop/single-event.hpp>

#include "config.hpp"
#include "peer-session.hpp"
#include "transfer-engine.hpp"

namespace pdrop {
// a peer session feeding a transfer engine
// a session which ends for any reason fails the unfinished transfers
class FileDrop {
  private:
    Config            config;
    PeerSession       session;
    TransferEngine    engine;
    coop::SingleEvent ready;
    bool              ready_notified = false;

    auto notify_ready() -> void;

  public:
    std::function<void(ConnectionState)> on_state_changed = [](ConnectionState) {};
    std::function<void(const Error&)>    on_error         = [](const Error&) {};

    auto connect(std::string_view room_id) -> bool;
    auto enqueue(std::vector<std::unique_ptr<FileSource>> files) -> std::vector<std::string>;
    // waits for the channel, sends the queue and the peer's confirmations, then disconnects
    // returns false if the channel never opened or any file failed
    auto send_all() -> coop::Async<bool>;
    // handles session events until the session ends
    auto run() -> coop::Async<void>;
    auto process_events() -> size_t;

    auto get_session() -> PeerSession&;
    auto get_engine() -> TransferEngine&;

    FileDrop(Config config, std::unique_ptr<SignalingLink> signaling, PeerTransportFactory transport_factory, std::function<TimePoint()> now = Clock::now);
};
} // namespace pdrop
