#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

struct ServerArgs {
    uint16_t port           = 8080;
    uint32_t room_ttl       = 3600; // seconds
    uint32_t sweep_interval = 300;  // seconds
    bool     help           = false;
    bool     verbose        = false;

    static auto parse(const int argc, const char* argv[], std::string_view program_name) -> std::optional<ServerArgs>;
};
