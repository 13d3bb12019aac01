#include <quire/schema/encoding/json/document.hpp>
#include <quire/schema/encoding/json/fields.hpp>

using namespace quire::schema;

namespace quire::schema::encoding::json {

Json::Value to_json(const document<1>& o) {
  auto value = Json::Value{Json::objectValue};
  value["id"] = o.id;
  value["fileName"] = o.file_name;
  value["mimeType"] = optional_to_json(o.mime_type);
  value["sizeBytes"] = Json::Value{Json::UInt64{o.size_bytes}};
  value["status"] = o.status;
  value["statusMessage"] = optional_to_json(o.status_message);
  value["textContent"] = optional_to_json(o.text_content);
  value["filePath"] = optional_to_json(o.file_path);
  value["isVectorized"] = o.is_vectorized;
  value["createdAt"] = format_iso8601(o.created_at);
  value["updatedAt"] = format_iso8601(o.updated_at);
  value["workspaceId"] = o.workspace_id;
  return value;
}

bool from_json(const Json::Value& value, document<1>& o, std::string& error) {
  if (!value.isObject()) {
    error = "document entry is not an object";
    return false;
  }
  const auto now = now_milliseconds();
  // Archives produced before the column rename carry `fileSize`.
  const auto* size_key = value.isMember("sizeBytes") ? "sizeBytes" : "fileSize";
  if (!read_string(value, "id", o.id, error) ||
      !read_string(value, "fileName", o.file_name, error) ||
      !read_optional_string(value, "mimeType", o.mime_type, error) ||
      !read_uint64(value, size_key, o.size_bytes, error) ||
      !read_string(value, "status", o.status, error) ||
      !read_optional_string(value, "statusMessage", o.status_message,
                            error) ||
      !read_optional_string(value, "textContent", o.text_content, error) ||
      !read_optional_string(value, "filePath", o.file_path, error) ||
      !read_bool(value, "isVectorized", o.is_vectorized, error) ||
      !read_timestamp(value, "createdAt", now, o.created_at, error) ||
      !read_timestamp(value, "updatedAt", o.created_at, o.updated_at,
                      error)) {
    return false;
  }
  // The owning workspace is decided by the archive layout, not by the file.
  o.workspace_id.clear();
  return true;
}

}  // namespace quire::schema::encoding::json
