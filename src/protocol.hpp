#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pdrop {
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    PeerLeft,
    Error,
};

auto to_string(ConnectionState state) -> std::string_view;

enum class ErrorKind {
    Signaling,   // relay rejected or could not parse a message
    Negotiation, // description or candidate could not be applied
    Transport,   // channel or peer connection failed
    Transfer,    // chunk read or send failed
};

struct Error {
    ErrorKind   kind;
    std::string message;
};

enum class DescriptionKind {
    Offer,
    Answer,
    Pranswer,
    Rollback,
};

auto to_string(DescriptionKind kind) -> std::string_view;
auto parse_description_kind(std::string_view str) -> std::optional<DescriptionKind>;

struct SessionDescription {
    DescriptionKind kind;
    std::string     sdp;

    auto operator==(const SessionDescription&) const -> bool = default;
};

struct Candidate {
    std::string                candidate;
    std::optional<std::string> sdp_mid;
    std::optional<int>         sdp_mline_index;
    std::optional<std::string> username_fragment;

    auto operator==(const Candidate&) const -> bool = default;
};

struct FileMetadata {
    std::string id;
    std::string name;
    uint64_t    size;
    std::string mime_type;
    uint64_t    total_chunks;

    auto operator==(const FileMetadata&) const -> bool = default;
};

// value of the "ufrag" attribute of a candidate line
auto find_candidate_ufrag(std::string_view candidate) -> std::optional<std::string>;
// media id to attach a remote candidate to, falls back to the m-line index
auto resolve_candidate_mid(const Candidate& candidate) -> std::string;

inline auto count_chunks(const uint64_t size, const uint64_t chunk_size) -> uint64_t {
    return (size + chunk_size - 1) / chunk_size;
}

enum class TransferStatus {
    Pending,
    Transferring,
    Paused,
    Completed,
    Cancelled,
    Error,
};

auto to_string(TransferStatus status) -> std::string_view;

inline auto is_terminal(const TransferStatus status) -> bool {
    return status == TransferStatus::Completed || status == TransferStatus::Cancelled || status == TransferStatus::Error;
}

enum class Direction {
    Sending,
    Receiving,
};

struct TransferInfo {
    std::string    id;
    Direction      direction;
    FileMetadata   metadata;
    TransferStatus status            = TransferStatus::Pending;
    uint64_t       bytes_transferred = 0;
    uint64_t       total_bytes       = 0;
    double         speed             = 0; // bytes per second
    double         eta               = 0; // seconds
    TimePoint      start_time;
    TimePoint      last_update_time;
    std::string    error;

    // sending side
    uint64_t current_chunk_index = 0;
    // receiving side
    uint64_t expected_chunks = 0;
    uint64_t received_chunks = 0;
};

// fresh random identifier, 8-4-4-4-12 hex like a version 4 uuid
auto generate_id() -> std::string;
} // namespace pdrop
