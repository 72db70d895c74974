#include <bit>
#include <filesystem>
#include <fstream>
#include <print>

#include <coop/promise.hpp>
#include <coop/runner.hpp>

#include "config.hpp"
#include "file-drop.hpp"
#include "file-source.hpp"
#include "macros/logger.hpp"
#include "rtc-transport.hpp"
#include "util/argument-parser.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace pdrop {
namespace {
auto logger = Logger("pdrop_client");

struct ClientArgs {
    const char*              config_file = nullptr;
    const char*              server_url  = "ws://localhost:8080/ws";
    const char*              room_id     = nullptr;
    const char*              output_dir  = ".";
    bool                     verbose     = false;
    std::vector<const char*> files;
};

// files to send follow a "--"
auto parse_args(const int argc, const char* argv[]) -> std::optional<ClientArgs> {
    auto args  = ClientArgs();
    auto split = 1;
    auto help  = false;
    while(split < argc && std::string_view(argv[split]) != "--") {
        split += 1;
    }
    for(auto i = split + 1; i < argc; i += 1) {
        args.files.push_back(argv[i]);
    }

    auto parser = args::Parser<uint16_t, uint8_t>();
    parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
    parser.kwarg(&args.config_file, {"-c", "--config"}, "FILE", "json file with ice servers and transfer tuning", {.state = args::State::Initialized});
    parser.kwarg(&args.server_url, {"-s", "--server"}, "URL", "rendezvous server url", {.state = args::State::DefaultValue});
    parser.kwarg(&args.room_id, {"-r", "--room"}, "ROOM", "room shared with the peer");
    parser.kwarg(&args.output_dir, {"-o", "--output"}, "DIR", "directory to store received files in", {.state = args::State::DefaultValue});
    parser.kwflag(&args.verbose, {"-v"}, "enable libdatachannel debug output");
    if(!parser.parse(split, argv) || help) {
        std::println("usage: peer-drop {} [-- FILE...]", parser.get_help());
        std::exit(0);
    }
    return args;
}

auto store_artifact(const std::filesystem::path& dir, const Artifact& artifact) -> bool {
    auto path = dir / sanitize_file_name(artifact.metadata.name);
    if(std::filesystem::exists(path)) {
        path = dir / (artifact.metadata.id + "-" + path.filename().string());
    }
    auto file = std::ofstream(path, std::ios::binary);
    ensure(file.is_open(), "cannot create {}", path.string());
    file.write(std::bit_cast<const char*>(artifact.data.data()), std::streamsize(artifact.data.size()));
    ensure(file.good(), "failed to write {}", path.string());
    LOG_INFO(logger, "saved {} ({} bytes, {})", path.string(), artifact.data.size(), artifact.metadata.mime_type);
    return true;
}

auto send_task(FileDrop& drop, bool& failed) -> coop::Async<void> {
    if(!co_await drop.send_all()) {
        failed = true;
    }
}

auto run(const ClientArgs& args) -> bool {
    auto config = Config();
    if(args.config_file != nullptr) {
        unwrap_mut(loaded, load_config(args.config_file));
        config = std::move(loaded);
    }
    ensure(args.room_id != nullptr && args.room_id[0] != '\0', "room id is required");
    ensure(std::filesystem::is_directory(args.output_dir), "output directory {} does not exist", args.output_dir);

    auto files = std::vector<std::unique_ptr<FileSource>>();
    for(const auto path : args.files) {
        unwrap_mut(file, DiskFile::open(path));
        files.emplace_back(std::move(file));
    }

    init_rtc_logger(args.verbose);

    auto  drop   = FileDrop(config, std::make_unique<RtcSignalingLink>(args.server_url), create_rtc_transport);
    auto& engine = drop.get_engine();
    auto  failed = false;

    drop.on_state_changed = [](const ConnectionState state) {
        std::println("{}", to_string(state));
    };
    drop.on_error = [](const Error& error) {
        std::println("error: {}", error.message);
    };
    engine.on_transfer_update = [](const TransferInfo& info) {
        LOG_DEBUG(logger, "{} {} {}/{} bytes {:.0f} B/s", info.metadata.name, to_string(info.status), info.bytes_transferred, info.total_bytes, info.speed);
    };
    engine.on_transfer_complete = [&args, &failed](const TransferInfo& info, const Artifact* artifact) {
        std::println("{} {}", info.direction == Direction::Sending ? "sent" : "received", info.metadata.name);
        if(artifact != nullptr && !store_artifact(args.output_dir, *artifact)) {
            failed = true;
        }
    };
    engine.on_transfer_error = [&failed](std::string_view id, std::string_view message) {
        std::println("transfer {} failed: {}", id, message);
        failed = true;
    };

    const auto ids = drop.enqueue(std::move(files));
    ensure(drop.connect(args.room_id));

    auto runner = coop::Runner();
    runner.push_task(drop.run());
    if(!ids.empty()) {
        runner.push_task(send_task(drop, failed));
    }
    runner.run();
    engine.cleanup();
    return !failed;
}
} // namespace
} // namespace pdrop

auto main(const int argc, const char* argv[]) -> int {
    using namespace pdrop;

    constexpr auto error_value = -1;

    logger.set_name_and_detect_loglevel("peer-drop");
    unwrap_v(args, parse_args(argc, argv));
    ensure_v(run(args));
    return 0;
}
