#include <mutex>
#include <unordered_map>

#include <coop/promise.hpp>
#include <coop/runner.hpp>
#include <coop/timer.hpp>
#include <rtc/rtc.hpp>

#include "macros/logger.hpp"
#include "rendezvous.hpp"
#include "room-registry.hpp"
#include "rtc-transport.hpp"
#include "server-args.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace pdrop {
namespace {
auto logger = Logger("pdrop_rendezvous_server");

constexpr auto signaling_path = "/ws";

class WebSocketEndpoint : public Endpoint {
  private:
    std::weak_ptr<rtc::WebSocket> ws;

  public:
    auto send(const std::string_view text) -> bool override {
        const auto socket = ws.lock();
        ensure(socket && socket->isOpen());
        try {
            return socket->send(std::string(text));
        } catch(const std::exception& e) {
            bail("failed to send to endpoint: {}", e.what());
        }
    }

    auto is_open() const -> bool override {
        const auto socket = ws.lock();
        return socket && socket->isOpen();
    }

    WebSocketEndpoint(std::weak_ptr<rtc::WebSocket> ws)
        : ws(std::move(ws)) {}
};

// keeps accepted sockets alive until they close
struct Connections {
    std::mutex                                                               lock;
    std::unordered_map<RendezvousSession*, std::shared_ptr<rtc::WebSocket>> sockets;
};

auto is_signaling_path(const std::optional<std::string>& path) -> bool {
    if(!path) {
        return true;
    }
    const auto view = std::string_view(*path);
    return view.substr(0, view.find('?')) == signaling_path;
}

auto sweep_loop(RoomRegistry& registry, const std::chrono::seconds ttl, const std::chrono::seconds interval) -> coop::Async<void> {
    while(true) {
        co_await coop::sleep(interval);
        if(const auto removed = registry.sweep(Clock::now(), ttl); removed > 0) {
            LOG_INFO(logger, "swept {} stale rooms, {} left", removed, registry.room_count());
        }
    }
}

auto run(const ServerArgs& args, RoomRegistry& registry, RendezvousService& service) -> bool {
    init_rtc_logger(args.verbose);

    auto connections = Connections();
    auto config      = rtc::WebSocketServer::Configuration();
    config.port      = args.port;
    config.enableTls = false;

    auto server = std::unique_ptr<rtc::WebSocketServer>();
    try {
        server = std::make_unique<rtc::WebSocketServer>(config);
    } catch(const std::exception& e) {
        bail("failed to listen on port {}: {}", args.port, e.what());
    }

    server->onClient([&service, &connections](std::shared_ptr<rtc::WebSocket> ws) {
        if(!is_signaling_path(ws->path())) {
            LOG_WARN(logger, "rejecting connection to {}", ws->path().value_or(""));
            ws->close();
            return;
        }
        const auto session = service.alloc_session(std::make_shared<WebSocketEndpoint>(ws));
        {
            auto guard = std::lock_guard(connections.lock);
            connections.sockets.emplace(session, ws);
        }
        ws->onMessage([&service, session](rtc::message_variant message) {
            if(const auto text = std::get_if<rtc::string>(&message)) {
                service.on_received(*session, *text);
            } else {
                LOG_WARN(logger, "dropping binary frame from {}", session->endpoint_id);
            }
        });
        ws->onError([session](std::string error) {
            LOG_WARN(logger, "endpoint {} error: {}", session->endpoint_id, error);
        });
        ws->onClosed([&service, &connections, session] {
            auto socket = std::shared_ptr<rtc::WebSocket>();
            {
                auto guard = std::lock_guard(connections.lock);
                if(const auto it = connections.sockets.find(session); it != connections.sockets.end()) {
                    socket = std::move(it->second);
                    connections.sockets.erase(it);
                }
            }
            service.free_session(session);
        });
    });
    LOG_INFO(logger, "listening on ws://0.0.0.0:{}{}", server->port(), signaling_path);

    auto runner = coop::Runner();
    runner.push_task(sweep_loop(registry, std::chrono::seconds(args.room_ttl), std::chrono::seconds(args.sweep_interval)));
    runner.run();
    return true;
}
} // namespace
} // namespace pdrop

auto main(const int argc, const char* argv[]) -> int {
    using namespace pdrop;

    constexpr auto error_value = -1;

    logger.set_name_and_detect_loglevel("pdrop-rendezvous");
    unwrap_v(args, ServerArgs::parse(argc, argv, "pdrop-rendezvous"));
    auto registry = RoomRegistry();
    auto service  = RendezvousService(registry);
    ensure_v(run(args, registry, service));
    return 0;
}
