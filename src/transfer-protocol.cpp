#include "transfer-protocol.hpp"
#include "json.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_WARN(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_transfer_proto");
}

namespace pdrop::proto {
namespace {
auto parse_metadata(const Json::Value& object) -> std::optional<FileMetadata> {
    unwrap_mut(id, json::get_string(object, "id"));
    unwrap_mut(name, json::get_string(object, "name"));
    unwrap(size, json::get_uint(object, "size"));
    unwrap_mut(type, json::get_string(object, "type"));
    unwrap(total_chunks, json::get_uint(object, "totalChunks"));
    return FileMetadata{
        .id           = std::move(id),
        .name         = std::move(name),
        .size         = size,
        .mime_type    = std::move(type),
        .total_chunks = total_chunks,
    };
}

auto dump_metadata(const FileMetadata& metadata) -> Json::Value {
    auto object           = Json::Value(Json::objectValue);
    object["id"]          = metadata.id;
    object["name"]        = metadata.name;
    object["size"]        = Json::UInt64(metadata.size);
    object["type"]        = metadata.mime_type;
    object["totalChunks"] = Json::UInt64(metadata.total_chunks);
    return object;
}

auto with_file_id(const char* const type, const std::string& file_id) -> Json::Value {
    auto root      = Json::Value(Json::objectValue);
    root["type"]   = type;
    root["fileId"] = file_id;
    return root;
}
} // namespace

auto parse_control_message(const std::string_view text) -> std::optional<ControlMessage> {
    unwrap(root, json::parse(text));
    unwrap(type, json::get_string(root, "type"));

    if(type == "file-metadata") {
        unwrap_mut(metadata, parse_metadata(root["metadata"]));
        return FileMetadataMessage{std::move(metadata)};
    }
    unwrap_mut(file_id, json::get_string(root, "fileId"));
    if(type == "chunk-ack") {
        unwrap(chunk_index, json::get_uint(root, "chunkIndex"));
        return ChunkAck{std::move(file_id), chunk_index};
    } else if(type == "transfer-complete") {
        return TransferComplete{std::move(file_id)};
    } else if(type == "transfer-cancel") {
        return TransferCancel{std::move(file_id)};
    } else if(type == "transfer-pause") {
        return TransferPause{std::move(file_id)};
    } else if(type == "transfer-resume") {
        return TransferResume{std::move(file_id)};
    }
    bail("unknown control message type {}", type);
}

auto dump_control_message(const ControlMessage& message) -> std::string {
    struct Visitor {
        auto operator()(const FileMetadataMessage& msg) const -> Json::Value {
            auto root        = Json::Value(Json::objectValue);
            root["type"]     = "file-metadata";
            root["metadata"] = dump_metadata(msg.metadata);
            return root;
        }
        auto operator()(const ChunkAck& msg) const -> Json::Value {
            auto root          = with_file_id("chunk-ack", msg.file_id);
            root["chunkIndex"] = Json::UInt64(msg.chunk_index);
            return root;
        }
        auto operator()(const TransferComplete& msg) const -> Json::Value {
            return with_file_id("transfer-complete", msg.file_id);
        }
        auto operator()(const TransferCancel& msg) const -> Json::Value {
            return with_file_id("transfer-cancel", msg.file_id);
        }
        auto operator()(const TransferPause& msg) const -> Json::Value {
            return with_file_id("transfer-pause", msg.file_id);
        }
        auto operator()(const TransferResume& msg) const -> Json::Value {
            return with_file_id("transfer-resume", msg.file_id);
        }
    };
    return json::dump(std::visit(Visitor(), message));
}
} // namespace pdrop::proto
