#pragma once

#include <quire/schema/primitives.hpp>
#include <array>
#include <string_view>

// Schema key type: store keys.
// Canonical key prefixes and key builders for the workspace keyspace. Child
// rows are nested under their workspace id so that one prefix scan finds
// everything a restore has to destroy.
namespace quire::schema::key {

inline constexpr std::string_view kFolderKeyPrefix{"STATE|FOLDER|"};
inline constexpr std::string_view kWorkspaceKeyPrefix{"STATE|WORKSPACE|"};
inline constexpr std::string_view kDocumentKeyPrefix{"STATE|DOCUMENT|"};
inline constexpr std::string_view kNoteKeyPrefix{"STATE|NOTE|"};

inline constexpr std::array<std::string_view, 4> kStoreKeyspaces{
    kFolderKeyPrefix,
    kWorkspaceKeyPrefix,
    kDocumentKeyPrefix,
    kNoteKeyPrefix,
};

bytes_t make_folder_key(const std::string_view& folder_id);
bytes_t make_workspace_key(const std::string_view& workspace_id);

bytes_t make_document_prefix(const std::string_view& workspace_id);
bytes_t make_document_key(const std::string_view& workspace_id,
                          const std::string_view& document_id);

bytes_t make_note_prefix(const std::string_view& workspace_id);
bytes_t make_note_key(const std::string_view& workspace_id,
                      const std::string_view& note_id);

}  // namespace quire::schema::key
