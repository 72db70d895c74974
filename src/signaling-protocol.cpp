#include "signaling-protocol.hpp"
#include "json.hpp"
#include "macros/logger.hpp"
#include "overloaded.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_DEBUG(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_signaling");
}

namespace pdrop::proto {
namespace {
auto parse_description(const Json::Value& object) -> std::optional<SessionDescription> {
    unwrap(kind_str, json::get_string(object, "type"));
    unwrap(kind, parse_description_kind(kind_str), "unknown description type {}", kind_str);
    unwrap_mut(sdp, json::get_string(object, "sdp"));
    return SessionDescription{kind, std::move(sdp)};
}

auto dump_description(const SessionDescription& desc) -> Json::Value {
    auto object    = Json::Value(Json::objectValue);
    object["type"] = std::string(to_string(desc.kind));
    object["sdp"]  = desc.sdp;
    return object;
}

auto parse_candidate(const Json::Value& object) -> std::optional<Candidate> {
    auto candidate = Candidate();
    unwrap_mut(str, json::get_string(object, "candidate"));
    candidate.candidate = std::move(str);
    ensure(json::get_nullable_string(object, "sdpMid", candidate.sdp_mid));
    ensure(json::get_nullable_int(object, "sdpMLineIndex", candidate.sdp_mline_index));
    ensure(json::get_nullable_string(object, "usernameFragment", candidate.username_fragment));
    return candidate;
}

template <class T>
auto nullable(const std::optional<T>& value) -> Json::Value {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

auto dump_candidate(const Candidate& candidate) -> Json::Value {
    auto object                = Json::Value(Json::objectValue);
    object["candidate"]        = candidate.candidate;
    object["sdpMid"]           = nullable(candidate.sdp_mid);
    object["sdpMLineIndex"]    = nullable(candidate.sdp_mline_index);
    object["usernameFragment"] = nullable(candidate.username_fragment);
    return object;
}
} // namespace

auto tag_of(const Envelope& envelope) -> std::string_view {
    return std::visit(Overloaded{
                          [](const Join&) { return "join"; },
                          [](const Offer&) { return "offer"; },
                          [](const Answer&) { return "answer"; },
                          [](const IceCandidate&) { return "ice-candidate"; },
                          [](const PeerJoined&) { return "peer-joined"; },
                          [](const PeerLeft&) { return "peer-left"; },
                          [](const Error&) { return "error"; },
                      },
                      envelope);
}

auto parse_envelope(const std::string_view text) -> std::optional<Envelope> {
    unwrap(root, json::parse(text));
    unwrap(type, json::get_string(root, "type"));

    if(type == "join") {
        unwrap_mut(room_id, json::get_string(root, "roomId"));
        return Join{std::move(room_id)};
    } else if(type == "offer") {
        unwrap_mut(desc, parse_description(root["offer"]));
        return Offer{std::move(desc)};
    } else if(type == "answer") {
        unwrap_mut(desc, parse_description(root["answer"]));
        return Answer{std::move(desc)};
    } else if(type == "ice-candidate") {
        unwrap_mut(candidate, parse_candidate(root["candidate"]));
        return IceCandidate{std::move(candidate)};
    } else if(type == "peer-joined") {
        return PeerJoined{};
    } else if(type == "peer-left") {
        return PeerLeft{};
    } else if(type == "error") {
        unwrap_mut(message, json::get_string(root, "message"));
        return Error{std::move(message)};
    }
    bail("unknown message type {}", type);
}

auto dump_envelope(const Envelope& envelope) -> std::string {
    auto root    = Json::Value(Json::objectValue);
    root["type"] = std::string(tag_of(envelope));
    std::visit(Overloaded{
                   [&root](const Join& msg) { root["roomId"] = msg.room_id; },
                   [&root](const Offer& msg) { root["offer"] = dump_description(msg.description); },
                   [&root](const Answer& msg) { root["answer"] = dump_description(msg.description); },
                   [&root](const IceCandidate& msg) { root["candidate"] = dump_candidate(msg.candidate); },
                   [](const PeerJoined&) {},
                   [](const PeerLeft&) {},
                   [&root](const Error& msg) { root["message"] = msg.message; },
               },
               envelope);
    return json::dump(root);
}
} // namespace pdrop::proto
