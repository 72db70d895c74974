#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"
#include "util/string-map.hpp"

namespace pdrop {
// connection of one endpoint as seen by the rendezvous server
struct Endpoint {
    virtual auto send(std::string_view text) -> bool = 0;
    virtual auto is_open() const -> bool             = 0;

    virtual ~Endpoint() {}
};

constexpr auto max_room_endpoints = size_t(2);

struct Room {
    struct Member {
        std::string               endpoint_id;
        std::shared_ptr<Endpoint> endpoint;
    };

    std::string         id;
    TimePoint           created_at;
    std::vector<Member> members;
    std::mutex          lock;
    bool                removed = false; // erased from the registry, joins must look the room up again
};

enum class JoinResult {
    Joined,
    Full,
    Missing,
};

class RoomRegistry {
  private:
    std::function<TimePoint()>       now;
    mutable std::mutex               lock;
    StringMap<std::shared_ptr<Room>> rooms;

    auto find(std::string_view room_id) const -> std::shared_ptr<Room>;

  public:
    auto create_or_get(std::string_view room_id) -> std::shared_ptr<Room>;
    auto join(std::string_view room_id, std::string_view endpoint_id, std::shared_ptr<Endpoint> endpoint) -> JoinResult;
    // removes the room when it becomes empty, the endpoint itself is left untouched
    auto leave(std::string_view room_id, std::string_view endpoint_id) -> void;
    auto other_endpoint(std::string_view room_id, std::string_view endpoint_id) const -> std::shared_ptr<Endpoint>;
    // deletes empty rooms created more than ttl before now, returns the number of deleted rooms
    auto sweep(TimePoint now, std::chrono::seconds ttl) -> size_t;

    auto endpoint_count(std::string_view room_id) const -> std::optional<size_t>;
    auto room_count() const -> size_t;

    RoomRegistry(std::function<TimePoint()> now = [] { return Clock::now(); });
};
} // namespace pdrop
