#include <algorithm>

#include "macros/logger.hpp"
#include "room-registry.hpp"

namespace {
auto logger = Logger("pdrop_registry");
}

namespace pdrop {
auto RoomRegistry::find(const std::string_view room_id) const -> std::shared_ptr<Room> {
    auto       guard = std::lock_guard(lock);
    const auto it    = rooms.find(room_id);
    return it != rooms.end() ? it->second : nullptr;
}

auto RoomRegistry::create_or_get(const std::string_view room_id) -> std::shared_ptr<Room> {
    auto guard = std::lock_guard(lock);
    if(const auto it = rooms.find(room_id); it != rooms.end()) {
        return it->second;
    }
    auto room        = std::make_shared<Room>();
    room->id         = std::string(room_id);
    room->created_at = now();
    rooms.insert(std::pair{room->id, room});
    LOG_INFO(logger, "created room {}", room_id);
    return room;
}

auto RoomRegistry::join(const std::string_view room_id, const std::string_view endpoint_id, std::shared_ptr<Endpoint> endpoint) -> JoinResult {
    const auto room = find(room_id);
    if(!room) {
        LOG_WARN(logger, "room {} not found", room_id);
        return JoinResult::Missing;
    }

    auto guard = std::lock_guard(room->lock);
    if(room->removed) {
        return JoinResult::Missing;
    }
    if(room->members.size() >= max_room_endpoints) {
        LOG_WARN(logger, "room {} is full", room_id);
        return JoinResult::Full;
    }
    room->members.push_back(Room::Member{std::string(endpoint_id), std::move(endpoint)});
    LOG_INFO(logger, "endpoint {} joined room {} ({}/{})", endpoint_id, room_id, room->members.size(), max_room_endpoints);
    return JoinResult::Joined;
}

auto RoomRegistry::leave(const std::string_view room_id, const std::string_view endpoint_id) -> void {
    auto guard = std::lock_guard(lock);

    const auto it = rooms.find(room_id);
    if(it == rooms.end()) {
        return;
    }
    // keep the room alive until its lock is released
    const auto holder     = it->second;
    auto&      room       = *holder;
    auto       room_guard = std::lock_guard(room.lock);
    std::erase_if(room.members, [endpoint_id](const Room::Member& member) { return member.endpoint_id == endpoint_id; });
    LOG_INFO(logger, "endpoint {} left room {} ({}/{})", endpoint_id, room_id, room.members.size(), max_room_endpoints);
    if(room.members.empty()) {
        room.removed = true;
        rooms.erase(it);
        LOG_INFO(logger, "removed empty room {}", room_id);
    }
}

auto RoomRegistry::other_endpoint(const std::string_view room_id, const std::string_view endpoint_id) const -> std::shared_ptr<Endpoint> {
    const auto room = find(room_id);
    if(!room) {
        return nullptr;
    }
    auto guard = std::lock_guard(room->lock);
    for(const auto& member : room->members) {
        if(member.endpoint_id != endpoint_id) {
            return member.endpoint;
        }
    }
    return nullptr;
}

auto RoomRegistry::sweep(const TimePoint now, const std::chrono::seconds ttl) -> size_t {
    auto guard   = std::lock_guard(lock);
    auto removed = size_t(0);
    for(auto it = rooms.begin(); it != rooms.end();) {
        const auto holder     = it->second;
        auto       room_guard = std::lock_guard(holder->lock);
        if(!holder->members.empty() || now - holder->created_at <= ttl) {
            it = std::next(it);
            continue;
        }
        LOG_INFO(logger, "cleaned up stale room {}", holder->id);
        holder->removed = true;
        it              = rooms.erase(it);
        removed += 1;
    }
    return removed;
}

auto RoomRegistry::endpoint_count(const std::string_view room_id) const -> std::optional<size_t> {
    const auto room = find(room_id);
    if(!room) {
        return std::nullopt;
    }
    auto guard = std::lock_guard(room->lock);
    return room->members.size();
}

auto RoomRegistry::room_count() const -> size_t {
    auto guard = std::lock_guard(lock);
    return rooms.size();
}

RoomRegistry::RoomRegistry(std::function<TimePoint()> now)
    : now(std::move(now)) {}
} // namespace pdrop
