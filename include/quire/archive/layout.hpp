#pragma once

#include <string_view>

// Fixed names of the archive tree.
//
//   manifest.json
//   folders.json
//   {workspaceId}/metadata.json
//   {workspaceId}/documents_meta.json
//   {workspaceId}/notepad_notes.json
//   {workspaceId}/notes.json
//   {workspaceId}/{documents,notes,vectors}/...
namespace quire::archive::layout {

inline constexpr std::string_view kManifestFile{"manifest.json"};
inline constexpr std::string_view kLegacyManifestFile{"backup_manifest.json"};
inline constexpr std::string_view kFoldersFile{"folders.json"};

inline constexpr std::string_view kMetadataFile{"metadata.json"};
inline constexpr std::string_view kDocumentsMetaFile{"documents_meta.json"};
inline constexpr std::string_view kNotepadNotesFile{"notepad_notes.json"};
inline constexpr std::string_view kLegacyNotesFile{"notes.json"};

inline constexpr std::string_view kContentDirectory{"content"};
inline constexpr std::string_view kArchiveFile{"backup.zip"};
inline constexpr std::string_view kArchiveContentType{"application/zip"};
inline constexpr std::string_view kArchiveNamePrefix{"notebook_backup_"};

inline constexpr std::string_view kBuildPrefix{"quire-backup"};
inline constexpr std::string_view kExtractPrefix{"quire-restore"};

}  // namespace quire::archive::layout
