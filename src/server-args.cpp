#include <print>

#include "server-args.hpp"
#include "util/argument-parser.hpp"

auto ServerArgs::parse(const int argc, const char* argv[], std::string_view program_name) -> std::optional<ServerArgs> {
    auto args   = ServerArgs();
    auto parser = args::Parser<uint16_t, uint32_t>();
    parser.kwflag(&args.help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
    parser.kwarg(&args.port, {"-p"}, "PORT", "port number to listen on", {.state = args::State::DefaultValue});
    parser.kwarg(&args.room_ttl, {"-t"}, "SECONDS", "lifetime of an empty room", {.state = args::State::DefaultValue});
    parser.kwarg(&args.sweep_interval, {"-i"}, "SECONDS", "interval between stale room sweeps", {.state = args::State::DefaultValue});
    parser.kwflag(&args.verbose, {"-v"}, "enable libdatachannel debug output");
    if(!parser.parse(argc, argv) || args.help) {
        std::println("usage: {} {}", program_name, parser.get_help());
        std::exit(0);
    }
    if(args.sweep_interval == 0) {
        std::println("sweep interval must be positive");
        return std::nullopt;
    }
    return args;
}
