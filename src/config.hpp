#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pdrop {
struct IceServer {
    std::vector<std::string> urls;
    std::string              username   = {};
    std::string              credential = {};
};

struct Config {
    std::vector<IceServer>    ice_servers = {
        {.urls = {"stun:stun.l.google.com:19302"}},
        {.urls = {"stun:stun1.l.google.com:19302"}},
    };
    size_t                    chunk_size          = 64 * 1024;  // bytes per binary frame
    size_t                    max_buffered_amount = 256 * 1024; // backpressure threshold in bytes
    std::chrono::milliseconds backpressure_delay  = std::chrono::milliseconds(50);
    // how long a finished sender waits for the receiver to confirm its files
    std::chrono::milliseconds ack_timeout         = std::chrono::milliseconds(10000);

    auto validate() const -> bool;
};

// keys follow the browser client: iceServers, chunkSize, maxBufferedAmount, backpressureDelayMs
// ackTimeoutMs is specific to this client
// missing keys keep the defaults
auto parse_config(std::string_view text) -> std::optional<Config>;
auto load_config(const char* path) -> std::optional<Config>;
} // namespace pdrop
