#include "config.hpp"
#include "json.hpp"
#include "macros/logger.hpp"
#include "util/file-io.hpp"
#include "util/span.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_config");
}

namespace pdrop {
namespace {
auto parse_urls(const Json::Value& value) -> std::optional<std::vector<std::string>> {
    if(value.isString()) {
        return std::vector{value.asString()};
    }
    ensure(value.isArray() && !value.empty(), "urls must be a string or a non-empty array");
    auto urls = std::vector<std::string>();
    for(const auto& url : value) {
        ensure(url.isString(), "urls must contain strings");
        urls.push_back(url.asString());
    }
    return urls;
}

auto parse_ice_server(const Json::Value& value) -> std::optional<IceServer> {
    ensure(value.isObject(), "ice server entry must be an object");
    unwrap_mut(urls, parse_urls(value["urls"]));
    auto server = IceServer{.urls = std::move(urls)};
    if(value.isMember("username")) {
        unwrap_mut(username, json::get_string(value, "username"));
        server.username = std::move(username);
    }
    if(value.isMember("credential")) {
        unwrap_mut(credential, json::get_string(value, "credential"));
        server.credential = std::move(credential);
    }
    return server;
}
} // namespace

auto Config::validate() const -> bool {
    ensure(chunk_size > 0, "chunk size must be positive");
    ensure(max_buffered_amount > 0, "max buffered amount must be positive");
    ensure(backpressure_delay.count() > 0, "backpressure delay must be positive");
    ensure(ack_timeout.count() > 0, "ack timeout must be positive");
    for(const auto& server : ice_servers) {
        ensure(!server.urls.empty(), "ice server without urls");
    }
    return true;
}

auto parse_config(const std::string_view text) -> std::optional<Config> {
    unwrap(root, json::parse(text));
    ensure(root.isObject(), "config root must be an object");

    auto config = Config();
    if(root.isMember("iceServers")) {
        const auto& servers = root["iceServers"];
        ensure(servers.isArray(), "iceServers must be an array");
        config.ice_servers.clear();
        for(const auto& entry : servers) {
            unwrap_mut(server, parse_ice_server(entry));
            config.ice_servers.push_back(std::move(server));
        }
    }
    if(root.isMember("chunkSize")) {
        unwrap(chunk_size, json::get_uint(root, "chunkSize"));
        config.chunk_size = chunk_size;
    }
    if(root.isMember("maxBufferedAmount")) {
        unwrap(amount, json::get_uint(root, "maxBufferedAmount"));
        config.max_buffered_amount = amount;
    }
    if(root.isMember("backpressureDelayMs")) {
        unwrap(delay, json::get_uint(root, "backpressureDelayMs"));
        config.backpressure_delay = std::chrono::milliseconds(delay);
    }
    if(root.isMember("ackTimeoutMs")) {
        unwrap(timeout, json::get_uint(root, "ackTimeoutMs"));
        config.ack_timeout = std::chrono::milliseconds(timeout);
    }
    ensure(config.validate());
    return config;
}

auto load_config(const char* const path) -> std::optional<Config> {
    unwrap(content, read_file(path), "failed to read config file {}", path);
    unwrap_mut(config, parse_config(from_span(content)), "invalid config file {}", path);
    return std::move(config);
}
} // namespace pdrop
