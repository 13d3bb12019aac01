#include <quire/schema/encoding/json/fields.hpp>
#include <quire/schema/encoding/json/manifest.hpp>

using namespace quire::schema;

namespace quire::schema::encoding::json {

namespace {

bool read_id_list(const Json::Value& value,
                  const char* key,
                  std::vector<id_t>& out,
                  std::string& error) {
  if (!value.isMember(key) || !value[key].isArray()) {
    error = std::string{"missing or non-array field '"} + key + "'";
    return false;
  }
  out.clear();
  out.reserve(value[key].size());
  for (const auto& entry : value[key]) {
    if (!entry.isString()) {
      error = std::string{"field '"} + key + "' must only contain strings";
      return false;
    }
    out.push_back(entry.asString());
  }
  return true;
}

bool read_created_at(const Json::Value& value,
                     std::string& out,
                     std::string& error) {
  if (!read_string(value, "createdAt", out, error)) {
    return false;
  }
  if (!parse_iso8601(out)) {
    error = "field 'createdAt' is not an ISO-8601 timestamp";
    return false;
  }
  return true;
}

}  // namespace

Json::Value to_json(const manifest<1>& o) {
  auto value = Json::Value{Json::objectValue};
  value["formatVersion"] = o.format_version;
  value["createdAt"] = o.created_at;
  auto ids = Json::Value{Json::arrayValue};
  for (const auto& id : o.workspace_ids) {
    ids.append(id);
  }
  value["workspaceIds"] = ids;
  return value;
}

bool from_json(const Json::Value& value, manifest<1>& o, std::string& error) {
  if (!value.isObject()) {
    error = "manifest is not an object";
    return false;
  }
  return read_string(value, "formatVersion", o.format_version, error) &&
         read_created_at(value, o.created_at, error) &&
         read_id_list(value, "workspaceIds", o.workspace_ids, error);
}

bool from_legacy_json(const Json::Value& value,
                      manifest<1>& o,
                      std::string& error) {
  if (!value.isObject()) {
    error = "legacy manifest is not an object";
    return false;
  }
  return read_string(value, "backupVersion", o.format_version, error) &&
         read_created_at(value, o.created_at, error) &&
         read_id_list(value, "notebooks", o.workspace_ids, error);
}

}  // namespace quire::schema::encoding::json
