#include <quire/schema/encoding/json/fields.hpp>
#include <quire/schema/encoding/json/file.hpp>
#include <quire/schema/encoding/json/workspace.hpp>

#include <array>
#include <string_view>

using namespace quire::schema;

namespace quire::schema::encoding::json {

namespace {

constexpr auto kModeledFields = std::array<std::string_view, 6>{
    "id", "title", "folderId", "createdAt", "updatedAt", "notes"};

bool is_modeled(const std::string_view name) {
  for (const auto field : kModeledFields) {
    if (field == name) {
      return true;
    }
  }
  return false;
}

}  // namespace

Json::Value to_json(const workspace<1>& o) {
  auto value = Json::Value{Json::objectValue};
  auto error = std::string{};
  auto extra = parse(o.extra_json, error);
  if (extra && extra->isObject()) {
    for (const auto& name : extra->getMemberNames()) {
      value[name] = (*extra)[name];
    }
  }
  value["id"] = o.id;
  value["title"] = o.title;
  value["folderId"] = optional_to_json(o.folder_id);
  value["createdAt"] = format_iso8601(o.created_at);
  value["updatedAt"] = format_iso8601(o.updated_at);
  value["notes"] = optional_to_json(o.notes);
  return value;
}

bool from_json(const Json::Value& value, workspace<1>& o, std::string& error) {
  if (!value.isObject()) {
    error = "workspace metadata is not an object";
    return false;
  }
  const auto now = now_milliseconds();
  if (!read_string(value, "id", o.id, error) ||
      !read_string(value, "title", o.title, error) ||
      !read_optional_string(value, "folderId", o.folder_id, error) ||
      !read_timestamp(value, "createdAt", now, o.created_at, error) ||
      !read_timestamp(value, "updatedAt", o.created_at, o.updated_at,
                      error) ||
      !read_optional_string(value, "notes", o.notes, error)) {
    return false;
  }

  auto extra = Json::Value{Json::objectValue};
  for (const auto& name : value.getMemberNames()) {
    if (is_modeled(name)) {
      continue;
    }
    // Nested objects belong to relations (documents, folder) that have
    // their own files; only scalar columns are carried.
    const auto& field = value[name];
    if (field.isObject() || field.isArray()) {
      continue;
    }
    extra[name] = field;
  }
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  o.extra_json = Json::writeString(builder, extra);
  return true;
}

}  // namespace quire::schema::encoding::json
