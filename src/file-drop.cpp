#include <coop/promise.hpp>
#include <coop/timer.hpp>

#include "file-drop.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("pdrop_drop");
}

namespace pdrop {
auto FileDrop::notify_ready() -> void {
    if(ready_notified) {
        return;
    }
    ready_notified = true;
    ready.notify();
}

auto FileDrop::connect(const std::string_view room_id) -> bool {
    return session.connect(room_id);
}

auto FileDrop::enqueue(std::vector<std::unique_ptr<FileSource>> files) -> std::vector<std::string> {
    return engine.enqueue(std::move(files));
}

auto FileDrop::send_all() -> coop::Async<bool> {
    if(!ready_notified) {
        co_await ready;
    }
    coop_ensure(session.is_connected(), "session ended before the channel opened");
    const auto ok = co_await engine.run_queue();

    // the receiver confirms every file, closing earlier could overtake the last frames
    const auto deadline = Clock::now() + config.ack_timeout;
    while(session.is_connected() && !engine.all_acknowledged()) {
        if(Clock::now() >= deadline) {
            LOG_WARN(logger, "peer did not confirm every file in time");
            break;
        }
        co_await coop::sleep(config.backpressure_delay);
    }
    session.disconnect();
    co_return ok;
}

auto FileDrop::run() -> coop::Async<void> {
    co_await session.run();
}

auto FileDrop::process_events() -> size_t {
    return session.process_events();
}

auto FileDrop::get_session() -> PeerSession& {
    return session;
}

auto FileDrop::get_engine() -> TransferEngine& {
    return engine;
}

FileDrop::FileDrop(Config config_, std::unique_ptr<SignalingLink> signaling, PeerTransportFactory transport_factory, std::function<TimePoint()> now)
    : config(std::move(config_)),
      session(config, std::move(signaling), std::move(transport_factory)),
      engine(config, session, std::move(now)) {
    session.on_state_changed = [this](const ConnectionState state) {
        if(state == ConnectionState::PeerLeft || state == ConnectionState::Error || state == ConnectionState::Disconnected) {
            engine.fail_all("Connection closed");
            notify_ready();
        }
        on_state_changed(state);
    };
    session.on_ready  = [this] { notify_ready(); };
    session.on_error  = [this](const Error& error) { on_error(error); };
    session.on_text   = [this](std::string text) { engine.handle_text(text); };
    session.on_binary = [this](std::vector<std::byte> data) { engine.handle_binary(data); };
}
} // namespace pdrop
