#include <quire/schema/encoding/json/fields.hpp>

#include <string>

namespace quire::schema::encoding::json {

namespace {

bool absent(const Json::Value& value, const char* key) {
  return !value.isMember(key) || value[key].isNull();
}

}  // namespace

bool read_string(const Json::Value& value,
                 const char* key,
                 std::string& out,
                 std::string& error) {
  if (!value.isMember(key) || !value[key].isString()) {
    error = std::string{"missing or non-string field '"} + key + "'";
    return false;
  }
  out = value[key].asString();
  return true;
}

bool read_optional_string(const Json::Value& value,
                          const char* key,
                          std::optional<std::string>& out,
                          std::string& error) {
  if (absent(value, key)) {
    out = std::nullopt;
    return true;
  }
  if (!value[key].isString()) {
    error = std::string{"field '"} + key + "' must be a string or null";
    return false;
  }
  out = value[key].asString();
  return true;
}

bool read_timestamp(const Json::Value& value,
                    const char* key,
                    const quire::schema::timestamp_milliseconds_t fallback,
                    quire::schema::timestamp_milliseconds_t& out,
                    std::string& error) {
  if (absent(value, key)) {
    out = fallback;
    return true;
  }
  const auto& field = value[key];
  if (field.isUInt64()) {
    if (field.asUInt64() > quire::schema::kMaxTimestampMilliseconds) {
      error = std::string{"field '"} + key + "' is out of range";
      return false;
    }
    out = field.asUInt64();
    return true;
  }
  if (field.isString()) {
    auto parsed = quire::schema::parse_iso8601(field.asString());
    if (parsed) {
      out = *parsed;
      return true;
    }
  }
  error = std::string{"field '"} + key + "' is not an ISO-8601 timestamp";
  return false;
}

bool read_uint64(const Json::Value& value,
                 const char* key,
                 uint64_t& out,
                 std::string& error) {
  if (absent(value, key)) {
    out = 0;
    return true;
  }
  if (!value[key].isUInt64()) {
    error = std::string{"field '"} + key + "' must be a non-negative integer";
    return false;
  }
  out = value[key].asUInt64();
  return true;
}

bool read_bool(const Json::Value& value,
               const char* key,
               bool& out,
               std::string& error) {
  if (absent(value, key)) {
    out = false;
    return true;
  }
  if (!value[key].isBool()) {
    error = std::string{"field '"} + key + "' must be a boolean";
    return false;
  }
  out = value[key].asBool();
  return true;
}

Json::Value optional_to_json(const std::optional<std::string>& value) {
  if (!value) {
    return Json::Value{Json::nullValue};
  }
  return Json::Value{*value};
}

}  // namespace quire::schema::encoding::json
