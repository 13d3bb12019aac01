#pragma once

#include <quire/schema/document.hpp>
#include <quire/schema/folder.hpp>
#include <quire/schema/note.hpp>
#include <quire/schema/primitives.hpp>
#include <quire/schema/workspace.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace quire::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline void write_text(const std::filesystem::path& path,
                       const std::string_view text) {
  std::filesystem::create_directories(path.parent_path());
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
}

inline std::string read_text(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

/// Relative path -> content for every regular file below `root`; directories
/// map to an empty marker so empty sub-trees compare too.
inline std::map<std::string, std::string> snapshot_tree(
    const std::filesystem::path& root) {
  auto out = std::map<std::string, std::string>{};
  auto ec = std::error_code{};
  if (!std::filesystem::exists(root, ec)) {
    return out;
  }
  for (const auto& entry :
       std::filesystem::recursive_directory_iterator{root}) {
    const auto name = entry.path().lexically_relative(root).generic_string();
    if (entry.is_directory()) {
      out[name + "/"] = "";
    } else {
      out[name] = read_text(entry.path());
    }
  }
  return out;
}

/// Number of entries directly below `root` whose name starts with `prefix`.
inline std::size_t count_entries(const std::filesystem::path& root,
                                 const std::string_view prefix) {
  auto count = std::size_t{};
  auto ec = std::error_code{};
  if (!std::filesystem::exists(root, ec)) {
    return count;
  }
  for (const auto& entry : std::filesystem::directory_iterator{root}) {
    if (entry.path().filename().string().starts_with(prefix)) {
      ++count;
    }
  }
  return count;
}

inline quire::schema::folder_t make_folder(
    const std::string& id,
    const std::optional<std::string>& parent_id = std::nullopt) {
  auto folder = quire::schema::folder_t{};
  folder.id = id;
  folder.name = "Folder " + id;
  folder.parent_id = parent_id;
  folder.created_at = 1747894682000;
  folder.updated_at = 1747894683000;
  return folder;
}

inline quire::schema::workspace_t make_workspace(
    const std::string& id,
    const std::optional<std::string>& folder_id = std::nullopt) {
  auto workspace = quire::schema::workspace_t{};
  workspace.id = id;
  workspace.title = "Notebook " + id;
  workspace.folder_id = folder_id;
  workspace.created_at = 1747894682000;
  workspace.updated_at = 1747894690123;
  workspace.notes = "{\"blocks\":[]}";
  return workspace;
}

inline quire::schema::document_t make_document(const std::string& workspace_id,
                                               const std::string& id) {
  auto document = quire::schema::document_t{};
  document.id = id;
  document.file_name = id + ".pdf";
  document.mime_type = "application/pdf";
  document.size_bytes = 1024;
  document.status = "COMPLETED";
  document.text_content = "text of " + id;
  document.file_path = workspace_id + "/" + id + ".pdf";
  document.is_vectorized = true;
  document.created_at = 1747894682000;
  document.updated_at = 1747894682500;
  document.workspace_id = workspace_id;
  return document;
}

inline quire::schema::note_t make_note(const std::string& workspace_id,
                                       const std::string& id) {
  auto note = quire::schema::note_t{};
  note.id = id;
  note.title = "Note " + id;
  note.content = "# " + id;
  note.created_at = 1747894682000;
  note.updated_at = 1747894682000;
  note.workspace_id = workspace_id;
  return note;
}

}  // namespace quire::testing
