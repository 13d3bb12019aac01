#include <quire/schema/key/builder.hpp>
#include <quire/schema/key/store_keys.hpp>

namespace quire::schema::key {

bytes_t make_folder_key(const std::string_view& folder_id) {
  auto b = builder{};
  b.write(kFolderKeyPrefix);
  b.component(folder_id);
  return b.data;
}

bytes_t make_workspace_key(const std::string_view& workspace_id) {
  auto b = builder{};
  b.write(kWorkspaceKeyPrefix);
  b.component(workspace_id);
  return b.data;
}

bytes_t make_document_prefix(const std::string_view& workspace_id) {
  auto b = builder{};
  b.write(kDocumentKeyPrefix);
  b.component(workspace_id);
  return b.data;
}

bytes_t make_document_key(const std::string_view& workspace_id,
                          const std::string_view& document_id) {
  auto b = builder{.data = make_document_prefix(workspace_id)};
  b.component(document_id);
  return b.data;
}

bytes_t make_note_prefix(const std::string_view& workspace_id) {
  auto b = builder{};
  b.write(kNoteKeyPrefix);
  b.component(workspace_id);
  return b.data;
}

bytes_t make_note_key(const std::string_view& workspace_id,
                      const std::string_view& note_id) {
  auto b = builder{.data = make_note_prefix(workspace_id)};
  b.component(note_id);
  return b.data;
}

}  // namespace quire::schema::key
