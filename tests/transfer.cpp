#include <print>

#include <coop/generator.hpp>
#include <coop/promise.hpp>
#include <coop/runner.hpp>
#include <coop/timer.hpp>

#include "fakes.hpp"
#include "macros/coop-unwrap.hpp"
#include "pdrop/transfer-engine.hpp"

namespace {
using namespace pdrop;
using namespace std::chrono_literals;

auto runner = (coop::Runner*)(nullptr);

auto make_config(const size_t chunk_size) -> Config {
    auto config                = Config();
    config.chunk_size          = chunk_size;
    config.max_buffered_amount = 16;
    config.backpressure_delay  = 1ms;
    return config;
}

auto memory_file(const std::string_view name, const std::string_view content) -> std::unique_ptr<FileSource> {
    return std::make_unique<MemoryFile>(std::string(name), "text/plain", fake::to_bytes(content));
}

template <class... Files>
auto file_list(Files... files) -> std::vector<std::unique_ptr<FileSource>> {
    auto list = std::vector<std::unique_ptr<FileSource>>();
    (list.push_back(std::move(files)), ...);
    return list;
}

// fails every read
class BrokenFile : public FileSource {
  public:
    auto get_name() const -> std::string_view override {
        return "broken.bin";
    }
    auto get_mime_type() const -> std::string_view override {
        return "application/octet-stream";
    }
    auto get_size() const -> uint64_t override {
        return 16;
    }
    auto read(uint64_t, size_t) -> std::optional<std::vector<std::byte>> override {
        return std::nullopt;
    }
};

auto control_tag(const std::string_view text) -> std::string_view {
    const auto message = proto::parse_control_message(text);
    if(!message) {
        return "invalid";
    }
    return std::visit([](const auto& msg) -> std::string_view {
        using T = std::decay_t<decltype(msg)>;
        if constexpr(std::is_same_v<T, proto::FileMetadataMessage>) {
            return "file-metadata";
        } else if constexpr(std::is_same_v<T, proto::ChunkAck>) {
            return "chunk-ack";
        } else if constexpr(std::is_same_v<T, proto::TransferComplete>) {
            return "transfer-complete";
        } else if constexpr(std::is_same_v<T, proto::TransferCancel>) {
            return "transfer-cancel";
        } else if constexpr(std::is_same_v<T, proto::TransferPause>) {
            return "transfer-pause";
        } else {
            return "transfer-resume";
        }
    },
                      *message);
}

// sender and receiver wired back to back
struct Pair {
    fake::Link     sender_link;
    fake::Link     receiver_link;
    TransferEngine sender;
    TransferEngine receiver;

    std::vector<Artifact>     artifacts;
    std::vector<std::string>  errors;
    std::vector<TransferInfo> sender_updates;

    Pair(const Config& config)
        : sender(config, sender_link),
          receiver(config, receiver_link) {
        sender_link.forward_text     = [this](std::string_view text) { receiver.handle_text(text); };
        sender_link.forward_binary   = [this](std::span<const std::byte> data) { receiver.handle_binary(data); };
        receiver_link.forward_text   = [this](std::string_view text) { sender.handle_text(text); };
        sender.on_transfer_update    = [this](const TransferInfo& info) { sender_updates.push_back(info); };
        sender.on_transfer_error     = [this](std::string_view, std::string_view message) { errors.emplace_back(message); };
        receiver.on_transfer_error   = [this](std::string_view, std::string_view message) { errors.emplace_back(message); };
        receiver.on_transfer_complete = [this](const TransferInfo&, const Artifact* artifact) {
            if(artifact != nullptr) {
                artifacts.push_back(*artifact);
            }
        };
    }
};

struct QueueResult {
    bool done   = false;
    bool result = false;
};

auto drain_queue(TransferEngine& engine, QueueResult& out) -> coop::Async<void> {
    out.result = co_await engine.run_queue();
    out.done   = true;
}

template <class Cond>
auto wait_until(Cond cond) -> coop::Async<bool> {
    for(auto i = 0; i < 2000; i += 1) {
        if(cond()) {
            co_return true;
        }
        co_await coop::sleep(1ms);
    }
    co_return false;
}

auto chunking_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(4));

    const auto ids = pair.sender.enqueue(file_list(memory_file("letters.txt", "ABCDEFGH")));
    coop_ensure(ids.size() == 1);
    coop_unwrap(pending, pair.sender.find_transfer(ids[0]));
    coop_ensure(pending.status == TransferStatus::Pending);
    coop_ensure(pending.metadata.total_chunks == 2);
    coop_ensure(pending.metadata.size == 8);

    coop_ensure(co_await pair.sender.run_queue());

    coop_ensure((pair.sender_link.binary_frames() == std::vector<std::string>{"ABCD", "EFGH"}));
    auto progress = std::vector<uint64_t>();
    for(const auto& info : pair.sender_updates) {
        if(info.status == TransferStatus::Transferring && info.bytes_transferred > 0) {
            progress.push_back(info.bytes_transferred);
        }
    }
    coop_ensure((progress == std::vector<uint64_t>{4, 8}));

    const auto texts = pair.sender_link.text_frames();
    coop_ensure(texts.size() == 2);
    coop_ensure(control_tag(texts[0]) == "file-metadata");
    coop_ensure(control_tag(texts[1]) == "transfer-complete");

    coop_ensure(pair.artifacts.size() == 1);
    const auto& artifact = pair.artifacts[0];
    coop_ensure(fake::as_string(artifact.data) == "ABCDEFGH");
    coop_ensure(artifact.metadata.mime_type == "text/plain");
    coop_ensure(artifact.metadata.name == "letters.txt");

    coop_unwrap(sent, pair.sender.find_transfer(ids[0]));
    coop_ensure(sent.status == TransferStatus::Completed);
    coop_ensure(sent.current_chunk_index == 2);
    coop_unwrap(received, pair.receiver.find_transfer(ids[0]));
    coop_ensure(received.status == TransferStatus::Completed);
    coop_ensure(received.bytes_transferred == received.total_bytes && received.total_bytes == received.metadata.size);
    coop_ensure(received.received_chunks == 2);
    coop_ensure(pair.errors.empty());
    co_return true;
}

auto empty_file_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(4));

    pair.sender.enqueue(file_list(memory_file("empty.txt", "")));
    coop_ensure(co_await pair.sender.run_queue());
    coop_ensure(pair.sender_link.binary_frames().empty());
    coop_ensure(pair.artifacts.size() == 1 && pair.artifacts[0].data.empty());
    co_return true;
}

auto backpressure_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(4));

    // the network is congested as soon as the file is announced
    auto violations         = 0;
    pair.sender_link.on_sent = [&pair, &violations](const fake::Link::Frame& frame) {
        if(std::holds_alternative<std::string>(frame)) {
            if(control_tag(std::get<std::string>(frame)) == "file-metadata") {
                pair.sender_link.buffered = 100;
            }
            return;
        }
        if(pair.sender_link.buffered > 16) {
            violations += 1;
        }
    };

    const auto ids    = pair.sender.enqueue(file_list(memory_file("data.bin", "0123456789abcdef")));
    auto       result = QueueResult();
    runner->push_task(drain_queue(pair.sender, result));

    coop_ensure(co_await wait_until([&pair] { return !pair.sender_link.text_frames().empty(); }));
    co_await coop::sleep(20ms);
    coop_ensure(pair.sender_link.binary_frames().empty());
    coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Transferring);

    // exactly at the threshold is still acceptable
    pair.sender_link.buffered = 16;
    coop_ensure(co_await wait_until([&result] { return result.done; }));
    coop_ensure(result.result);
    coop_ensure(violations == 0);
    coop_ensure((pair.sender_link.binary_frames() == std::vector<std::string>{"0123", "4567", "89ab", "cdef"}));
    co_return true;
}

auto pause_resume_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(1));

    const auto ids = pair.sender.enqueue(file_list(memory_file("digits.txt", "0123456789")));
    const auto id  = ids[0];
    auto       paused = false;
    pair.sender.on_transfer_update = [&pair, &paused, &id](const TransferInfo& info) {
        if(!paused && info.status == TransferStatus::Transferring && info.current_chunk_index == 3) {
            paused = pair.sender.pause(id);
        }
    };

    auto result = QueueResult();
    runner->push_task(drain_queue(pair.sender, result));

    coop_ensure(co_await wait_until([&paused] { return paused; }));
    co_await coop::sleep(20ms);
    coop_ensure((pair.sender_link.binary_frames() == std::vector<std::string>{"0", "1", "2"}));
    coop_ensure(pair.sender.find_transfer(id)->status == TransferStatus::Paused);
    coop_ensure(pair.sender.find_transfer(id)->current_chunk_index == 3);
    // the receiver was told
    coop_ensure(pair.receiver.find_transfer(id)->status == TransferStatus::Paused);

    // pausing twice and resuming a running transfer are no-ops
    coop_ensure(!pair.sender.pause(id));
    coop_ensure(pair.sender.resume(id));
    coop_ensure(!pair.sender.resume(id));
    coop_ensure(co_await wait_until([&result] { return result.done; }));
    coop_ensure(result.result);

    const auto chunks = pair.sender_link.binary_frames();
    coop_ensure(chunks.size() == 10);
    for(auto i = 0; i < 10; i += 1) {
        coop_ensure(chunks[i] == std::to_string(i));
    }
    coop_ensure(pair.artifacts.size() == 1 && fake::as_string(pair.artifacts[0].data) == "0123456789");
    co_return true;
}

auto remote_pause_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(1));

    const auto ids = pair.sender.enqueue(file_list(memory_file("digits.txt", "0123456789")));
    const auto id  = ids[0];
    auto       paused = false;
    pair.sender.on_transfer_update = [&pair, &paused, &id](const TransferInfo& info) {
        if(!paused && info.status == TransferStatus::Transferring && info.current_chunk_index == 5) {
            paused = pair.receiver.pause(id);
        }
    };

    auto result = QueueResult();
    runner->push_task(drain_queue(pair.sender, result));

    coop_ensure(co_await wait_until([&paused] { return paused; }));
    co_await coop::sleep(20ms);
    coop_ensure(pair.sender.find_transfer(id)->status == TransferStatus::Paused);
    coop_ensure(pair.sender_link.binary_frames().size() == 5);
    coop_ensure(pair.receiver.resume(id));
    coop_ensure(co_await wait_until([&result] { return result.done; }));
    coop_ensure(result.result);
    coop_ensure(pair.artifacts.size() == 1 && fake::as_string(pair.artifacts[0].data) == "0123456789");
    co_return true;
}

auto cancel_test() -> coop::Async<bool> {
    // pending
    {
        auto pair = Pair(make_config(4));
        const auto ids = pair.sender.enqueue(file_list(memory_file("a.txt", "aaaa"), memory_file("b.txt", "bbbb")));
        coop_ensure(pair.sender.cancel(ids[1]));
        coop_ensure(pair.sender.find_transfer(ids[1]) == nullptr);
        coop_ensure(pair.sender_updates.back().status == TransferStatus::Cancelled);
        coop_ensure(co_await pair.sender.run_queue());
        coop_ensure(pair.artifacts.size() == 1 && pair.artifacts[0].metadata.name == "a.txt");
        // completed and unknown transfers
        coop_ensure(!pair.sender.cancel(ids[0]));
        coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Completed);
        coop_ensure(!pair.sender.cancel("no-such-transfer"));
        coop_ensure(!pair.sender.pause("no-such-transfer"));
        coop_ensure(!pair.sender.resume(ids[0]));
    }
    // transferring
    {
        auto pair = Pair(make_config(1));
        const auto ids = pair.sender.enqueue(file_list(memory_file("a.txt", "0123456789")));
        const auto id  = ids[0];
        auto       cancelled = false;
        pair.sender.on_transfer_update = [&pair, &cancelled, &id](const TransferInfo& info) {
            if(!cancelled && info.status == TransferStatus::Transferring && info.current_chunk_index == 2) {
                cancelled = pair.sender.cancel(id);
            }
        };
        coop_ensure(co_await pair.sender.run_queue());
        coop_ensure(cancelled);
        coop_ensure(pair.sender_link.binary_frames().size() == 2);
        coop_ensure(pair.sender.find_transfer(id) == nullptr);
        // the receiver dropped its half
        coop_ensure(pair.receiver.find_transfer(id) == nullptr);
        coop_ensure(pair.artifacts.empty());
        coop_ensure(control_tag(pair.sender_link.text_frames().back()) == "transfer-cancel");
    }
    // paused, from the receiving side
    {
        auto pair = Pair(make_config(1));
        const auto ids = pair.sender.enqueue(file_list(memory_file("a.txt", "0123456789")));
        const auto id  = ids[0];
        auto       paused = false;
        pair.sender.on_transfer_update = [&pair, &paused, &id](const TransferInfo& info) {
            if(!paused && info.status == TransferStatus::Transferring && info.current_chunk_index == 4) {
                paused = pair.sender.pause(id);
            }
        };
        auto result = QueueResult();
        runner->push_task(drain_queue(pair.sender, result));
        coop_ensure(co_await wait_until([&paused] { return paused; }));
        coop_ensure(pair.receiver.cancel(id));
        coop_ensure(pair.receiver.find_transfer(id) == nullptr);
        coop_ensure(co_await wait_until([&result] { return result.done; }));
        coop_ensure(result.result);
        coop_ensure(pair.sender.find_transfer(id) == nullptr);
        coop_ensure(pair.sender_link.binary_frames().size() == 4);
    }
    // failed
    {
        auto pair = Pair(make_config(4));
        const auto ids = pair.sender.enqueue(file_list(std::make_unique<BrokenFile>()));
        coop_ensure(!co_await pair.sender.run_queue());
        coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Error);
        coop_ensure(!pair.sender.cancel(ids[0]));
        coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Error);
    }
    co_return true;
}

auto multi_file_test() -> coop::Async<bool> {
    auto pair = Pair(make_config(3));

    const auto ids = pair.sender.enqueue(file_list(memory_file("one.txt", "first file"), memory_file("two.txt", "second")));
    coop_ensure(ids.size() == 2 && ids[0] != ids[1]);
    coop_ensure(pair.sender.find_transfer(ids[1])->status == TransferStatus::Pending);
    coop_ensure(co_await pair.sender.run_queue());

    // file-metadata(1) chunks transfer-complete(1) file-metadata(2) chunks transfer-complete(2)
    auto tags = std::vector<std::string_view>();
    for(const auto& frame : pair.sender_link.frames) {
        if(const auto text = std::get_if<std::string>(&frame)) {
            tags.push_back(control_tag(*text));
        } else {
            tags.push_back("chunk");
        }
    }
    const auto expected = std::vector<std::string_view>{
        "file-metadata", "chunk", "chunk", "chunk", "chunk", "transfer-complete",
        "file-metadata", "chunk", "chunk", "transfer-complete"};
    coop_ensure(tags == expected);

    coop_ensure(pair.artifacts.size() == 2);
    coop_ensure(fake::as_string(pair.artifacts[0].data) == "first file");
    coop_ensure(fake::as_string(pair.artifacts[1].data) == "second");
    co_return true;
}

auto failure_test() -> coop::Async<bool> {
    // a broken file does not stop the queue
    {
        auto pair = Pair(make_config(4));
        const auto ids = pair.sender.enqueue(file_list(std::make_unique<BrokenFile>(), memory_file("ok.txt", "fine")));
        coop_ensure(!co_await pair.sender.run_queue());
        coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Error);
        coop_ensure(pair.sender.find_transfer(ids[1])->status == TransferStatus::Completed);
        // the receiver is told to drop the announced file
        coop_ensure((pair.errors == std::vector<std::string>{"Failed to read file"}));
        const auto texts = pair.sender_link.text_frames();
        coop_ensure(texts.size() == 4);
        coop_ensure(control_tag(texts[0]) == "file-metadata");
        coop_ensure(control_tag(texts[1]) == "transfer-cancel");
        coop_ensure(pair.receiver.find_transfer(ids[0]) == nullptr);
        coop_ensure(pair.artifacts.size() == 1 && pair.artifacts[0].metadata.name == "ok.txt");
    }
    // a lost connection fails everything left
    {
        auto pair = Pair(make_config(1));
        const auto ids = pair.sender.enqueue(file_list(memory_file("a.txt", "0123456789"), memory_file("b.txt", "xyz")));
        pair.sender.on_transfer_update = [&pair](const TransferInfo& info) {
            if(info.current_chunk_index == 3) {
                pair.sender_link.connected = false;
            }
        };
        coop_ensure(!co_await pair.sender.run_queue());
        coop_ensure(pair.sender.find_transfer(ids[0])->status == TransferStatus::Error);
        coop_ensure(pair.sender.find_transfer(ids[1])->status == TransferStatus::Error);
        coop_ensure(pair.sender_link.binary_frames().size() == 3);
        // nothing can be sent over a lost link
        for(const auto& text : pair.sender_link.text_frames()) {
            coop_ensure(control_tag(text) != "transfer-cancel");
        }
        // the receiver side is failed by the session owner
        pair.receiver.fail_all("Connection closed");
        coop_ensure(pair.receiver.find_transfer(ids[0])->status == TransferStatus::Error);
        coop_ensure(pair.receiver.find_transfer(ids[0])->error == "Connection closed");
        pair.receiver.cleanup();
        coop_ensure(pair.receiver.get_transfers().empty());
    }
    co_return true;
}

auto acknowledgement_test() -> coop::Async<bool> {
    {
        auto pair = Pair(make_config(4));
        const auto ids = pair.sender.enqueue(file_list(memory_file("a.txt", "aaaaaa"), memory_file("b.txt", "bb")));
        coop_ensure(pair.sender.all_acknowledged());
        coop_ensure(co_await pair.sender.run_queue());
        coop_ensure(pair.sender.all_acknowledged());
        const auto texts = pair.receiver_link.text_frames();
        coop_ensure(texts.size() == 2);
        coop_ensure(control_tag(texts[0]) == "transfer-complete" && control_tag(texts[1]) == "transfer-complete");
        coop_ensure(std::get<proto::TransferComplete>(*proto::parse_control_message(texts[0])).file_id == ids[0]);
    }
    // a peer which never confirms
    {
        auto pair = Pair(make_config(4));
        pair.receiver_link.forward_text = nullptr;
        pair.sender.enqueue(file_list(memory_file("a.txt", "aaaaaa")));
        coop_ensure(co_await pair.sender.run_queue());
        coop_ensure(pair.artifacts.size() == 1);
        coop_ensure(!pair.sender.all_acknowledged());
    }
    // failed and cancelled transfers are not waited for
    {
        auto pair = Pair(make_config(4));
        const auto ids = pair.sender.enqueue(file_list(std::make_unique<BrokenFile>(), memory_file("b.txt", "bb")));
        coop_ensure(pair.sender.cancel(ids[1]));
        coop_ensure(!co_await pair.sender.run_queue());
        coop_ensure(pair.sender.all_acknowledged());
    }
    co_return true;
}

auto receiver_check_test() -> coop::Async<bool> {
    auto link     = fake::Link();
    auto receiver = TransferEngine(make_config(4), link);
    auto errors   = std::vector<std::string>();
    auto complete = 0;
    receiver.on_transfer_error    = [&errors](std::string_view, std::string_view message) { errors.emplace_back(message); };
    receiver.on_transfer_complete = [&complete](const TransferInfo&, const Artifact*) { complete += 1; };

    const auto metadata = [](const std::string_view id, const uint64_t size) {
        return proto::dump_control_message(proto::FileMetadataMessage{FileMetadata{
            .id           = std::string(id),
            .name         = "short.bin",
            .size         = size,
            .mime_type    = "application/octet-stream",
            .total_chunks = count_chunks(size, 4),
        }});
    };

    // fewer bytes than announced
    receiver.handle_text(metadata("f1", 8));
    receiver.handle_binary(fake::to_bytes("ABCD"));
    receiver.handle_text(proto::dump_control_message(proto::TransferComplete{"f1"}));
    coop_ensure(receiver.find_transfer("f1")->status == TransferStatus::Error);
    coop_ensure(errors.size() == 1);
    coop_ensure(complete == 0);

    // more bytes than announced
    receiver.handle_text(metadata("f2", 4));
    receiver.handle_binary(fake::to_bytes("ABCD"));
    receiver.handle_binary(fake::to_bytes("E"));
    coop_ensure(receiver.find_transfer("f2")->status == TransferStatus::Error);
    coop_ensure(errors.size() == 2);

    // chunks without an active transfer and unknown messages are dropped
    receiver.handle_binary(fake::to_bytes("ZZZZ"));
    receiver.handle_text(R"({"type":"chunk-ack","fileId":"f2","chunkIndex":0})");
    receiver.handle_text(R"({"type":"mystery"})");
    receiver.handle_text(proto::dump_control_message(proto::TransferComplete{"nope"}));
    coop_ensure(errors.size() == 2);
    coop_ensure(complete == 0);

    receiver.handle_text(metadata("f3", 5));
    receiver.handle_binary(fake::to_bytes("ABCD"));
    receiver.handle_binary(fake::to_bytes("E"));
    receiver.handle_text(proto::dump_control_message(proto::TransferComplete{"f3"}));
    coop_ensure(complete == 1);
    coop_unwrap(info, receiver.find_transfer("f3"));
    coop_ensure(info.status == TransferStatus::Completed);
    coop_ensure(info.bytes_transferred == 5 && info.received_chunks == 2 && info.expected_chunks == 2);
    co_return true;
}

auto pass = false;

auto run_tests() -> coop::Async<void> {
    coop_ensure(co_await chunking_test());
    coop_ensure(co_await empty_file_test());
    coop_ensure(co_await backpressure_test());
    coop_ensure(co_await pause_resume_test());
    coop_ensure(co_await remote_pause_test());
    coop_ensure(co_await cancel_test());
    coop_ensure(co_await multi_file_test());
    coop_ensure(co_await failure_test());
    coop_ensure(co_await acknowledgement_test());
    coop_ensure(co_await receiver_check_test());
    pass = true;
}
} // namespace

auto main() -> int {
    auto runner = coop::Runner();
    ::runner    = &runner;
    runner.push_task(run_tests());
    runner.run();

    if(pass) {
        std::println("pass");
        return 0;
    } else {
        return -1;
    }
}
