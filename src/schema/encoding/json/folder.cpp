#include <quire/schema/encoding/json/fields.hpp>
#include <quire/schema/encoding/json/folder.hpp>

using namespace quire::schema;

namespace quire::schema::encoding::json {

Json::Value to_json(const folder<1>& o) {
  auto value = Json::Value{Json::objectValue};
  value["id"] = o.id;
  value["name"] = o.name;
  value["parentId"] = optional_to_json(o.parent_id);
  value["createdAt"] = format_iso8601(o.created_at);
  value["updatedAt"] = format_iso8601(o.updated_at);
  return value;
}

bool from_json(const Json::Value& value, folder<1>& o, std::string& error) {
  if (!value.isObject()) {
    error = "folder entry is not an object";
    return false;
  }
  const auto now = now_milliseconds();
  return read_string(value, "id", o.id, error) &&
         read_string(value, "name", o.name, error) &&
         read_optional_string(value, "parentId", o.parent_id, error) &&
         read_timestamp(value, "createdAt", now, o.created_at, error) &&
         read_timestamp(value, "updatedAt", o.created_at, o.updated_at, error);
}

}  // namespace quire::schema::encoding::json
