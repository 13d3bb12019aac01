#include <quire/schema/encoding/json/fields.hpp>
#include <quire/schema/encoding/json/note.hpp>

using namespace quire::schema;

namespace quire::schema::encoding::json {

Json::Value to_json(const note<1>& o) {
  auto value = Json::Value{Json::objectValue};
  value["id"] = o.id;
  value["title"] = optional_to_json(o.title);
  value["content"] = optional_to_json(o.content);
  value["createdAt"] = format_iso8601(o.created_at);
  value["updatedAt"] = format_iso8601(o.updated_at);
  value["workspaceId"] = o.workspace_id;
  return value;
}

bool from_json(const Json::Value& value, note<1>& o, std::string& error) {
  if (!value.isObject()) {
    error = "note entry is not an object";
    return false;
  }
  const auto now = now_milliseconds();
  if (!read_string(value, "id", o.id, error) ||
      !read_optional_string(value, "title", o.title, error) ||
      !read_optional_string(value, "content", o.content, error) ||
      !read_timestamp(value, "createdAt", now, o.created_at, error) ||
      !read_timestamp(value, "updatedAt", o.created_at, o.updated_at,
                      error)) {
    return false;
  }
  o.workspace_id.clear();
  return true;
}

}  // namespace quire::schema::encoding::json
