#pragma once
#include <quire/common/status.hpp>
#include <quire/schema/document.hpp>
#include <quire/schema/folder.hpp>
#include <quire/schema/note.hpp>
#include <quire/schema/primitives.hpp>
#include <quire/schema/workspace.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace quire::storage {

using key_value_entry_t =
    std::pair<quire::schema::bytes_t, quire::schema::bytes_t>;

/// Group of writes applied atomically by `storage::commit`.
template <typename Library>
struct write_batch;

/// Relational view over the workspace keyspace.
///
/// Reads report failures through the returned status; a missing row is not a
/// failure and leaves the optional output empty. Writes that must be atomic
/// are staged into a `write_batch` and applied with `commit`.
template <typename Library>
struct storage {
  bool is_open() const;

  quire::common::status load_folder(
      const std::string_view& folder_id,
      std::optional<quire::schema::folder_t>& out) const;
  quire::common::status list_folders(
      std::vector<quire::schema::folder_t>& out) const;
  quire::common::status load_workspace(
      const std::string_view& workspace_id,
      std::optional<quire::schema::workspace_t>& out) const;
  quire::common::status list_workspaces(
      std::vector<quire::schema::workspace_t>& out) const;
  quire::common::status list_documents(
      const std::string_view& workspace_id,
      std::vector<quire::schema::document_t>& out) const;
  quire::common::status list_notes(
      const std::string_view& workspace_id,
      std::vector<quire::schema::note_t>& out) const;

  /// Insert or overwrite a folder keeping its id.
  quire::common::status save_folder(
      const quire::schema::folder_t& folder) const;

  /// Stage deletion of a workspace row and all of its documents and notes.
  /// `existed` reports whether the workspace row was present; absence is not
  /// an error.
  quire::common::status stage_destroy_workspace(
      write_batch<Library>& batch,
      const std::string_view& workspace_id,
      bool& existed) const;
  quire::common::status stage_workspace(
      write_batch<Library>& batch,
      const quire::schema::workspace_t& workspace) const;
  quire::common::status stage_document(
      write_batch<Library>& batch,
      const quire::schema::document_t& document) const;
  quire::common::status stage_note(write_batch<Library>& batch,
                                   const quire::schema::note_t& note) const;

  /// Apply every staged operation or none of them.
  quire::common::status commit(write_batch<Library>& batch) const;

  /// Collect all key-value pairs that share the provided key prefix. A scan
  /// that stops on a read error fails instead of returning a partial list.
  quire::common::status list_by_prefix(
      const quire::schema::bytes_view_t& prefix,
      std::vector<key_value_entry_t>& out) const;
};

/// Construct a concrete storage backend rooted at filesystem path. When the
/// backend cannot be opened the returned handle reports `is_open() == false`
/// and every operation fails with `store_failure`.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace quire::storage
