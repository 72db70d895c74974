#pragma once
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <coop/generator.hpp>

#include "chunk-arena.hpp"
#include "config.hpp"
#include "file-source.hpp"
#include "protocol.hpp"
#include "transfer-protocol.hpp"
#include "transport.hpp"
#include "util/string-map.hpp"

namespace pdrop {
// a fully received file
struct Artifact {
    FileMetadata           metadata;
    std::vector<std::byte> data;
};

// moves files over an established TransferLink, one outgoing file at a time
// not thread safe, everything including run_queue runs on the session runner
class TransferEngine {
  private:
    struct Outgoing {
        TransferInfo                info;
        std::unique_ptr<FileSource> source;
        bool                        acknowledged = false;
    };

    struct Incoming {
        TransferInfo info;
        ChunkArena   chunks;
    };

    Config                       config;
    TransferLink*                link;
    std::function<TimePoint()>   now;
    StringMap<Outgoing>          outgoing;
    StringMap<Incoming>          incoming;
    std::deque<std::string>      queue;
    bool                         draining = false;

    auto find_outgoing(std::string_view id) -> Outgoing*;
    auto find_incoming(std::string_view id) -> Incoming*;
    auto find_active_incoming() -> Incoming*;
    auto notify_peer(const proto::ControlMessage& message) -> bool;
    auto update_rate(TransferInfo& info) -> void;
    auto fail(TransferInfo& info, std::string message) -> void;
    auto send_file(std::string id) -> coop::Async<bool>;

    auto handle_metadata(const FileMetadata& metadata) -> void;
    auto handle_complete(std::string_view id) -> void;
    auto handle_remote_cancel(std::string_view id) -> void;
    auto handle_remote_pause(std::string_view id, bool pause) -> void;

  public:
    std::function<void(const TransferInfo&)>                  on_transfer_update   = [](const TransferInfo&) {};
    // artifact is null for outgoing transfers
    std::function<void(const TransferInfo&, const Artifact*)> on_transfer_complete = [](const TransferInfo&, const Artifact*) {};
    std::function<void(std::string_view, std::string_view)>   on_transfer_error    = [](std::string_view, std::string_view) {};

    // registers pending outgoing transfers in submission order, returns their ids
    auto enqueue(std::vector<std::unique_ptr<FileSource>> files) -> std::vector<std::string>;
    // sends queued files until the queue is empty
    // returns false if any of them failed, returns immediately if another call is already draining
    auto run_queue() -> coop::Async<bool>;

    auto pause(std::string_view id) -> bool;
    auto resume(std::string_view id) -> bool;
    auto cancel(std::string_view id) -> bool;

    // inbound frames from the link
    auto handle_text(std::string_view text) -> void;
    auto handle_binary(std::span<const std::byte> data) -> void;

    // marks every unfinished transfer as failed and releases its buffers
    auto fail_all(std::string_view message) -> void;
    // forgets every transfer
    auto cleanup() -> void;

    auto find_transfer(std::string_view id) const -> const TransferInfo*;
    auto get_transfers() const -> std::vector<const TransferInfo*>;
    // true once the peer confirmed every completed outgoing file
    auto all_acknowledged() const -> bool;
    auto is_draining() const -> bool;

    TransferEngine(Config config, TransferLink& link, std::function<TimePoint()> now = Clock::now);
};
} // namespace pdrop
