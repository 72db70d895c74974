#include <algorithm>
#include <array>
#include <format>
#include <random>
#include <vector>

#include "protocol.hpp"

namespace pdrop {
auto to_string(const ConnectionState state) -> std::string_view {
    switch(state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::PeerLeft:
        return "peer-left";
    case ConnectionState::Error:
        return "error";
    }
    return "unknown";
}

namespace {
const auto description_kind_str = std::array{
    "offer",    // Offer
    "answer",   // Answer
    "pranswer", // Pranswer
    "rollback", // Rollback
};
} // namespace

auto to_string(const DescriptionKind kind) -> std::string_view {
    return description_kind_str[size_t(kind)];
}

auto parse_description_kind(const std::string_view str) -> std::optional<DescriptionKind> {
    for(auto i = size_t(0); i < description_kind_str.size(); i += 1) {
        if(str == description_kind_str[i]) {
            return DescriptionKind(i);
        }
    }
    return std::nullopt;
}

auto to_string(const TransferStatus status) -> std::string_view {
    switch(status) {
    case TransferStatus::Pending:
        return "pending";
    case TransferStatus::Transferring:
        return "transferring";
    case TransferStatus::Paused:
        return "paused";
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Cancelled:
        return "cancelled";
    case TransferStatus::Error:
        return "error";
    }
    return "unknown";
}

auto find_candidate_ufrag(const std::string_view candidate) -> std::optional<std::string> {
    // attributes after the address part are "name value" pairs
    auto tokens = std::vector<std::string_view>();
    for(auto pos = size_t(0); pos < candidate.size();) {
        const auto end = std::min(candidate.find(' ', pos), candidate.size());
        if(end > pos) {
            tokens.push_back(candidate.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    for(auto i = size_t(0); i + 1 < tokens.size(); i += 1) {
        if(tokens[i] == "ufrag") {
            return std::string(tokens[i + 1]);
        }
    }
    return std::nullopt;
}

auto resolve_candidate_mid(const Candidate& candidate) -> std::string {
    if(candidate.sdp_mid) {
        return *candidate.sdp_mid;
    }
    // the data channel is the only media section and is numbered from zero
    return std::to_string(candidate.sdp_mline_index.value_or(0));
}

auto generate_id() -> std::string {
    thread_local auto engine = std::mt19937_64(std::random_device()());

    const auto hi = engine();
    const auto lo = engine();
    return std::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
                       uint32_t(hi >> 32),
                       uint16_t(hi >> 16),
                       uint16_t(hi & 0x0fff),
                       uint16_t(0x8000 | ((lo >> 48) & 0x3fff)),
                       lo & 0xffffffffffff);
}
} // namespace pdrop
