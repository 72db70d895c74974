#include <format>

#include <coop/promise.hpp>
#include <coop/timer.hpp>

#include "macros/logger.hpp"
#include "overloaded.hpp"
#include "transfer-engine.hpp"
#include "util/cleaner.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_transfer");
}

namespace pdrop {
namespace {
// upper bound of the up-front reservation, the announced size comes from the peer
constexpr auto max_arena_reserve = size_t(64) * 1024 * 1024;
} // namespace

auto TransferEngine::find_outgoing(const std::string_view id) -> Outgoing* {
    const auto it = outgoing.find(id);
    return it != outgoing.end() ? &it->second : nullptr;
}

auto TransferEngine::find_incoming(const std::string_view id) -> Incoming* {
    const auto it = incoming.find(id);
    return it != incoming.end() ? &it->second : nullptr;
}

auto TransferEngine::find_active_incoming() -> Incoming* {
    for(auto& [id, entry] : incoming) {
        if(entry.info.status == TransferStatus::Transferring || entry.info.status == TransferStatus::Paused) {
            return &entry;
        }
    }
    return nullptr;
}

auto TransferEngine::notify_peer(const proto::ControlMessage& message) -> bool {
    ensure(link->is_connected(), "not connected, cannot notify peer");
    ensure(link->send_text(proto::dump_control_message(message)), "failed to send control message");
    return true;
}

auto TransferEngine::update_rate(TransferInfo& info) -> void {
    const auto time    = now();
    const auto elapsed = std::chrono::duration<double>(time - info.start_time).count();
    info.speed            = elapsed > 0 ? double(info.bytes_transferred) / elapsed : 0;
    info.eta              = info.speed > 0 ? double(info.total_bytes - info.bytes_transferred) / info.speed : 0;
    info.last_update_time = time;
}

auto TransferEngine::fail(TransferInfo& info, std::string message) -> void {
    LOG_ERROR(logger, "transfer {} ({}) failed: {}", info.id, info.metadata.name, message);
    const auto announced  = info.status == TransferStatus::Transferring || info.status == TransferStatus::Paused;
    info.status           = TransferStatus::Error;
    info.error            = std::move(message);
    info.last_update_time = now();
    if(info.direction == Direction::Receiving) {
        if(const auto entry = find_incoming(info.id)) {
            entry->chunks.clear();
        }
    } else {
        if(const auto entry = find_outgoing(info.id)) {
            entry->source.reset();
        }
        // the peer already holds the metadata and would wait for the rest
        if(announced && link->is_connected() && !link->send_text(proto::dump_control_message(proto::TransferCancel{info.id}))) {
            LOG_WARN(logger, "peer was not told about the failure of {}", info.id);
        }
    }
    on_transfer_update(info);
    on_transfer_error(info.id, info.error);
}

auto TransferEngine::send_file(const std::string id) -> coop::Async<bool> {
    {
        const auto entry = find_outgoing(id);
        coop_ensure(entry != nullptr);
        auto& info = entry->info;
        if(!link->is_connected()) {
            fail(info, "Not connected to peer");
            co_return false;
        }
        if(!link->send_text(proto::dump_control_message(proto::FileMetadataMessage{info.metadata}))) {
            fail(info, "Failed to send file metadata");
            co_return false;
        }
        LOG_INFO(logger, "sending {} ({} bytes, {} chunks)", info.metadata.name, info.total_bytes, info.metadata.total_chunks);
        info.status           = TransferStatus::Transferring;
        info.start_time       = now();
        info.last_update_time = info.start_time;
        on_transfer_update(info);
    }

    // the record may be paused, cancelled or failed whenever control returns to the runner or the link
    while(true) {
        auto entry = find_outgoing(id);
        if(entry == nullptr) {
            LOG_INFO(logger, "transfer {} cancelled", id);
            co_return true;
        }
        auto& info = entry->info;
        if(info.status == TransferStatus::Error) {
            co_return false;
        }
        if(info.status == TransferStatus::Paused || link->buffered_amount() > config.max_buffered_amount) {
            co_await coop::sleep(config.backpressure_delay);
            continue;
        }
        if(info.bytes_transferred >= info.total_bytes) {
            break;
        }
        if(!link->is_connected()) {
            fail(info, "Connection lost");
            co_return false;
        }

        const auto offset = info.bytes_transferred;
        const auto size   = size_t(std::min<uint64_t>(config.chunk_size, info.total_bytes - offset));
        const auto chunk  = entry->source->read(offset, size);
        if(!chunk) {
            fail(info, "Failed to read file");
            co_return false;
        }
        if(!link->send_binary(*chunk)) {
            fail(info, "Failed to send chunk");
            co_return false;
        }

        entry = find_outgoing(id);
        if(entry == nullptr) {
            continue;
        }
        entry->info.current_chunk_index += 1;
        entry->info.bytes_transferred += size;
        update_rate(entry->info);
        on_transfer_update(entry->info);

        // let the session deliver inbound control messages between chunks
        co_await coop::sleep(std::chrono::milliseconds(0));
    }

    const auto entry = find_outgoing(id);
    auto&      info  = entry->info;
    info.status      = TransferStatus::Completed;
    info.eta         = 0;
    entry->source.reset();
    LOG_INFO(logger, "sent {}", info.metadata.name);
    // the peer needs transfer-complete before the metadata of the next file
    if(!notify_peer(proto::TransferComplete{id})) {
        fail(info, "Failed to send completion");
        co_return false;
    }
    on_transfer_update(info);
    on_transfer_complete(info, nullptr);
    co_return true;
}

auto TransferEngine::handle_metadata(const FileMetadata& metadata) -> void {
    if(find_incoming(metadata.id) != nullptr || find_outgoing(metadata.id) != nullptr) {
        LOG_WARN(logger, "ignoring duplicated metadata for {}", metadata.id);
        return;
    }
    if(const auto active = find_active_incoming()) {
        fail(active->info, "Interrupted by the next file");
    }
    LOG_INFO(logger, "receiving {} ({} bytes, {} chunks)", metadata.name, metadata.size, metadata.total_chunks);

    const auto time  = now();
    auto&      entry = incoming[metadata.id];
    entry.info = TransferInfo{
        .id               = metadata.id,
        .direction        = Direction::Receiving,
        .metadata         = metadata,
        .status           = TransferStatus::Transferring,
        .total_bytes      = metadata.size,
        .start_time       = time,
        .last_update_time = time,
        .expected_chunks  = metadata.total_chunks,
    };
    entry.chunks.reserve(size_t(std::min<uint64_t>(metadata.size, max_arena_reserve)));
    on_transfer_update(entry.info);
}

auto TransferEngine::handle_complete(const std::string_view id) -> void {
    // echoed back by the receiver once the file is reassembled
    if(const auto sent = find_outgoing(id)) {
        if(sent->info.status != TransferStatus::Completed) {
            LOG_WARN(logger, "acknowledgement for {} transfer {}", to_string(sent->info.status), id);
            return;
        }
        LOG_DEBUG(logger, "peer acknowledged {}", sent->info.metadata.name);
        sent->acknowledged = true;
        return;
    }
    const auto entry = find_incoming(id);
    if(entry == nullptr) {
        LOG_WARN(logger, "completion for unknown transfer {}", id);
        return;
    }
    auto& info = entry->info;
    if(info.status != TransferStatus::Transferring && info.status != TransferStatus::Paused) {
        LOG_WARN(logger, "completion for {} transfer {}", to_string(info.status), id);
        return;
    }
    if(entry->chunks.get_size() != info.metadata.size) {
        fail(info, std::format("Size mismatch: expected {} bytes, received {}", info.metadata.size, entry->chunks.get_size()));
        return;
    }
    if(entry->chunks.get_chunk_count() != info.expected_chunks) {
        LOG_WARN(logger, "{} arrived in {} chunks, {} announced", info.metadata.name, entry->chunks.get_chunk_count(), info.expected_chunks);
    }

    const auto artifact = Artifact{
        .metadata = info.metadata,
        .data     = entry->chunks.release(),
    };
    info.status            = TransferStatus::Completed;
    info.bytes_transferred = info.total_bytes;
    info.eta               = 0;
    info.last_update_time  = now();
    LOG_INFO(logger, "received {}", info.metadata.name);
    on_transfer_update(info);
    on_transfer_complete(info, &artifact);
    if(!notify_peer(proto::TransferComplete{std::string(id)})) {
        LOG_WARN(logger, "peer was not told about the reception of {}", id);
    }
}

auto TransferEngine::handle_remote_cancel(const std::string_view id) -> void {
    auto info = std::optional<TransferInfo>();
    if(const auto it = outgoing.find(id); it != outgoing.end() && !is_terminal(it->second.info.status)) {
        info.emplace(std::move(it->second.info));
        outgoing.erase(it);
    } else if(const auto it = incoming.find(id); it != incoming.end() && !is_terminal(it->second.info.status)) {
        info.emplace(std::move(it->second.info));
        incoming.erase(it);
    } else {
        LOG_DEBUG(logger, "ignoring cancel for {}", id);
        return;
    }
    LOG_INFO(logger, "peer cancelled {}", info->metadata.name);
    info->status           = TransferStatus::Cancelled;
    info->last_update_time = now();
    on_transfer_update(*info);
}

auto TransferEngine::handle_remote_pause(const std::string_view id, const bool pause) -> void {
    const auto from = pause ? TransferStatus::Transferring : TransferStatus::Paused;
    const auto to   = pause ? TransferStatus::Paused : TransferStatus::Transferring;

    auto info = (TransferInfo*)(nullptr);
    if(const auto entry = find_outgoing(id)) {
        info = &entry->info;
    } else if(const auto entry = find_incoming(id)) {
        info = &entry->info;
    }
    if(info == nullptr || info->status != from) {
        LOG_DEBUG(logger, "ignoring {} for {}", pause ? "pause" : "resume", id);
        return;
    }
    LOG_INFO(logger, "peer {} {}", pause ? "paused" : "resumed", info->metadata.name);
    info->status = to;
    on_transfer_update(*info);
}

auto TransferEngine::enqueue(std::vector<std::unique_ptr<FileSource>> files) -> std::vector<std::string> {
    auto ids = std::vector<std::string>();
    for(auto& file : files) {
        auto       id   = generate_id();
        const auto size = file->get_size();
        auto&      entry = outgoing[id];
        entry.info = TransferInfo{
            .id        = id,
            .direction = Direction::Sending,
            .metadata  = {
                 .id           = id,
                 .name         = std::string(file->get_name()),
                 .size         = size,
                 .mime_type    = std::string(file->get_mime_type()),
                 .total_chunks = count_chunks(size, config.chunk_size),
            },
            .status      = TransferStatus::Pending,
            .total_bytes = size,
        };
        entry.source = std::move(file);
        on_transfer_update(entry.info);
        queue.push_back(id);
        ids.push_back(std::move(id));
    }
    return ids;
}

auto TransferEngine::run_queue() -> coop::Async<bool> {
    if(draining) {
        co_return true;
    }
    draining           = true;
    const auto cleaner = Cleaner{[this] { draining = false; }};

    auto ok = true;
    while(!queue.empty()) {
        auto id = std::move(queue.front());
        queue.pop_front();
        const auto entry = find_outgoing(id);
        if(entry == nullptr || entry->info.status != TransferStatus::Pending) {
            // cancelled or failed while waiting
            continue;
        }
        if(!co_await send_file(id)) {
            ok = false;
            if(!link->is_connected()) {
                fail_all("Connection lost");
                break;
            }
        }
    }
    co_return ok;
}

auto TransferEngine::pause(const std::string_view id) -> bool {
    auto info = (TransferInfo*)(nullptr);
    if(const auto entry = find_outgoing(id)) {
        info = &entry->info;
    } else if(const auto entry = find_incoming(id)) {
        info = &entry->info;
    }
    if(info == nullptr || info->status != TransferStatus::Transferring) {
        return false;
    }
    info->status = TransferStatus::Paused;
    if(!notify_peer(proto::TransferPause{info->id})) {
        LOG_WARN(logger, "peer was not told about the pause of {}", info->id);
    }
    on_transfer_update(*info);
    return true;
}

auto TransferEngine::resume(const std::string_view id) -> bool {
    auto info = (TransferInfo*)(nullptr);
    if(const auto entry = find_outgoing(id)) {
        info = &entry->info;
    } else if(const auto entry = find_incoming(id)) {
        info = &entry->info;
    }
    if(info == nullptr || info->status != TransferStatus::Paused) {
        return false;
    }
    info->status = TransferStatus::Transferring;
    if(!notify_peer(proto::TransferResume{info->id})) {
        LOG_WARN(logger, "peer was not told about the resume of {}", info->id);
    }
    on_transfer_update(*info);
    return true;
}

auto TransferEngine::cancel(const std::string_view id) -> bool {
    auto info = std::optional<TransferInfo>();
    if(const auto it = outgoing.find(id); it != outgoing.end() && !is_terminal(it->second.info.status)) {
        info.emplace(std::move(it->second.info));
        outgoing.erase(it);
    } else if(const auto it = incoming.find(id); it != incoming.end() && !is_terminal(it->second.info.status)) {
        info.emplace(std::move(it->second.info));
        incoming.erase(it);
    } else {
        return false;
    }
    LOG_INFO(logger, "cancelled {}", info->metadata.name);
    info->status           = TransferStatus::Cancelled;
    info->last_update_time = now();
    if(link->is_connected() && !notify_peer(proto::TransferCancel{info->id})) {
        LOG_WARN(logger, "peer was not told about the cancellation of {}", info->id);
    }
    on_transfer_update(*info);
    return true;
}

auto TransferEngine::handle_text(const std::string_view text) -> void {
    const auto message = proto::parse_control_message(text);
    if(!message) {
        LOG_WARN(logger, "dropping malformed control message");
        return;
    }
    std::visit(Overloaded{
                   [this](const proto::FileMetadataMessage& msg) { handle_metadata(msg.metadata); },
                   [](const proto::ChunkAck& msg) { LOG_DEBUG(logger, "chunk-ack {} #{}", msg.file_id, msg.chunk_index); },
                   [this](const proto::TransferComplete& msg) { handle_complete(msg.file_id); },
                   [this](const proto::TransferCancel& msg) { handle_remote_cancel(msg.file_id); },
                   [this](const proto::TransferPause& msg) { handle_remote_pause(msg.file_id, true); },
                   [this](const proto::TransferResume& msg) { handle_remote_pause(msg.file_id, false); },
               },
               *message);
}

auto TransferEngine::handle_binary(const std::span<const std::byte> data) -> void {
    const auto entry = find_active_incoming();
    if(entry == nullptr) {
        LOG_WARN(logger, "dropping {} bytes without an active transfer", data.size());
        return;
    }
    auto& info = entry->info;
    if(info.bytes_transferred + data.size() > info.total_bytes) {
        fail(info, "Received more data than announced");
        return;
    }
    entry->chunks.append(data);
    info.bytes_transferred += data.size();
    info.received_chunks += 1;
    update_rate(info);
    on_transfer_update(info);
}

auto TransferEngine::fail_all(const std::string_view message) -> void {
    queue.clear();
    for(auto& [id, entry] : outgoing) {
        if(!is_terminal(entry.info.status)) {
            fail(entry.info, std::string(message));
        }
    }
    for(auto& [id, entry] : incoming) {
        if(!is_terminal(entry.info.status)) {
            fail(entry.info, std::string(message));
        }
    }
}

auto TransferEngine::cleanup() -> void {
    queue.clear();
    outgoing.clear();
    incoming.clear();
}

auto TransferEngine::find_transfer(const std::string_view id) const -> const TransferInfo* {
    if(const auto it = outgoing.find(id); it != outgoing.end()) {
        return &it->second.info;
    }
    if(const auto it = incoming.find(id); it != incoming.end()) {
        return &it->second.info;
    }
    return nullptr;
}

auto TransferEngine::get_transfers() const -> std::vector<const TransferInfo*> {
    auto ret = std::vector<const TransferInfo*>();
    for(const auto& [id, entry] : outgoing) {
        ret.push_back(&entry.info);
    }
    for(const auto& [id, entry] : incoming) {
        ret.push_back(&entry.info);
    }
    return ret;
}

auto TransferEngine::all_acknowledged() const -> bool {
    for(const auto& [id, entry] : outgoing) {
        if(entry.info.status == TransferStatus::Completed && !entry.acknowledged) {
            return false;
        }
    }
    return true;
}

auto TransferEngine::is_draining() const -> bool {
    return draining;
}

TransferEngine::TransferEngine(Config config, TransferLink& link, std::function<TimePoint()> now)
    : config(std::move(config)),
      link(&link),
      now(std::move(now)) {}
} // namespace pdrop
