#pragma once
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace pdrop::json {
auto parse(std::string_view text) -> std::optional<Json::Value>;
// compact single line output
auto dump(const Json::Value& value) -> std::string;

auto get_string(const Json::Value& object, const char* key) -> std::optional<std::string>;
auto get_uint(const Json::Value& object, const char* key) -> std::optional<uint64_t>;
// absent and null both yield nullopt, other types fail
auto get_nullable_string(const Json::Value& object, const char* key, std::optional<std::string>& out) -> bool;
auto get_nullable_int(const Json::Value& object, const char* key, std::optional<int>& out) -> bool;
} // namespace pdrop::json
