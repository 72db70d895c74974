#include <memory>

#include "json.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_DEBUG(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("pdrop_json");
}

namespace pdrop::json {
auto parse(const std::string_view text) -> std::optional<Json::Value> {
    auto builder               = Json::CharReaderBuilder();
    builder["collectComments"] = false;
    builder["rejectDupKeys"]   = true;

    const auto reader = std::unique_ptr<Json::CharReader>(builder.newCharReader());
    auto       root   = Json::Value();
    auto       errors = std::string();
    ensure(reader->parse(text.data(), text.data() + text.size(), &root, &errors), "malformed json: {}", errors);
    return root;
}

auto dump(const Json::Value& value) -> std::string {
    auto builder           = Json::StreamWriterBuilder();
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

auto get_string(const Json::Value& object, const char* const key) -> std::optional<std::string> {
    ensure(object.isObject());
    const auto& member = object[key];
    ensure(member.isString(), "{} is not a string", key);
    return member.asString();
}

auto get_uint(const Json::Value& object, const char* const key) -> std::optional<uint64_t> {
    ensure(object.isObject());
    const auto& member = object[key];
    ensure(member.isUInt64(), "{} is not an unsigned integer", key);
    return member.asUInt64();
}

auto get_nullable_string(const Json::Value& object, const char* const key, std::optional<std::string>& out) -> bool {
    ensure(object.isObject());
    const auto& member = object[key];
    if(member.isNull()) {
        out.reset();
        return true;
    }
    ensure(member.isString(), "{} is not a string", key);
    out = member.asString();
    return true;
}

auto get_nullable_int(const Json::Value& object, const char* const key, std::optional<int>& out) -> bool {
    ensure(object.isObject());
    const auto& member = object[key];
    if(member.isNull()) {
        out.reset();
        return true;
    }
    ensure(member.isInt(), "{} is not an integer", key);
    out = member.asInt();
    return true;
}
} // namespace pdrop::json
