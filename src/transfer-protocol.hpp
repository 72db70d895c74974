#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "protocol.hpp"

// sender <-> (data channel) <-> receiver
// control messages are json text frames, chunks are raw binary frames
namespace pdrop::proto {
// sender   -> receiver announce the next file, chunks follow
struct FileMetadataMessage {
    FileMetadata metadata;
};

// receiver -> sender   reserved for per-chunk acknowledgement, ignored
struct ChunkAck {
    std::string file_id;
    uint64_t    chunk_index;
};

// sender   -> receiver all chunks of the file were sent
struct TransferComplete {
    std::string file_id;
};

// sender  <-> receiver drop the transfer
struct TransferCancel {
    std::string file_id;
};

// sender  <-> receiver stop issuing chunks until resumed
struct TransferPause {
    std::string file_id;
};

// sender  <-> receiver continue from the retained chunk index
struct TransferResume {
    std::string file_id;
};

using ControlMessage = std::variant<FileMetadataMessage, ChunkAck, TransferComplete, TransferCancel, TransferPause, TransferResume>;

auto parse_control_message(std::string_view text) -> std::optional<ControlMessage>;
auto dump_control_message(const ControlMessage& message) -> std::string;
} // namespace pdrop::proto
