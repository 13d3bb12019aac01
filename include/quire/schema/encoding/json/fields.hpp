#pragma once
#include <quire/schema/primitives.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>

// Field readers shared by the archive JSON codecs. Each reader returns false
// and fills `error` when the member has the wrong type; optional members that
// are absent or null leave the output untouched.
namespace quire::schema::encoding::json {

bool read_string(const Json::Value& value,
                 const char* key,
                 std::string& out,
                 std::string& error);

bool read_optional_string(const Json::Value& value,
                          const char* key,
                          std::optional<std::string>& out,
                          std::string& error);

/// Accepts ISO-8601 strings and integral milliseconds. Absent or null values
/// fall back to `fallback`.
bool read_timestamp(const Json::Value& value,
                    const char* key,
                    quire::schema::timestamp_milliseconds_t fallback,
                    quire::schema::timestamp_milliseconds_t& out,
                    std::string& error);

bool read_uint64(const Json::Value& value,
                 const char* key,
                 uint64_t& out,
                 std::string& error);

bool read_bool(const Json::Value& value,
               const char* key,
               bool& out,
               std::string& error);

Json::Value optional_to_json(const std::optional<std::string>& value);

}  // namespace quire::schema::encoding::json
