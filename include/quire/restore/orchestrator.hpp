#pragma once

#include <quire/archive/archive_extractor.hpp>
#include <quire/common/status.hpp>
#include <quire/restore/failure_policy.hpp>
#include <quire/restore/workspace_lock.hpp>
#include <quire/schema/backup_request.hpp>
#include <quire/schema/document.hpp>
#include <quire/schema/enum_string.hpp>
#include <quire/schema/note.hpp>
#include <quire/schema/workspace.hpp>
#include <quire/storage/blob_store.hpp>
#include <quire/storage/rocksdb/storage.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quire::restore {

enum class restore_phase : uint8_t {
  idle = 0,
  restoring_folders = 1,
  restoring_workspaces = 2,
  completed = 3,
  failed = 4,
};

inline constexpr auto kRestorePhaseMappings = std::array{
    std::pair<std::string_view, restore_phase>{"idle", restore_phase::idle},
    std::pair<std::string_view, restore_phase>{
        "restoring_folders", restore_phase::restoring_folders},
    std::pair<std::string_view, restore_phase>{
        "restoring_workspaces", restore_phase::restoring_workspaces},
    std::pair<std::string_view, restore_phase>{"completed",
                                               restore_phase::completed},
    std::pair<std::string_view, restore_phase>{"failed",
                                               restore_phase::failed},
};

inline constexpr std::string_view to_string(const restore_phase value) {
  return quire::schema::to_string(value, kRestorePhaseMappings)
      .value_or("unknown");
}

struct workspace_result final {
  quire::schema::id_t workspace_id;
  quire::common::status status;
};

/// Outcome of one restore call.
///
/// `status` is ok only when every workspace was restored. Under
/// `failure_policy::best_effort` the per-workspace outcomes are in
/// `workspace_results`; payloads are returned for restored workspaces only.
struct restore_result final {
  quire::common::status status;
  std::string message;
  std::vector<quire::schema::restored_payload_t> restored_payloads;
  std::vector<workspace_result> workspace_results;
  restore_phase phase{restore_phase::idle};
};

/// Workspace rows decoded from one archive directory, ready to be staged.
struct workspace_snapshot final {
  quire::schema::workspace_t workspace;
  std::vector<quire::schema::document_t> documents;
  std::vector<quire::schema::note_t> notes;
  std::string legacy_payload;
};

/// Rebuilds folders and workspaces from an extracted archive.
///
/// Folders are restored once, up front. Each workspace is then destroyed
/// and recreated under its id, with its rows committed in one write batch
/// and its blob tree swapped in afterwards, so a failure before the commit
/// leaves that workspace exactly as it was.
class orchestrator final {
 public:
  orchestrator(
      const quire::storage::storage<quire::storage::rocksdb_storage_tag>&
          storage,
      const quire::storage::blob_store& blobs,
      workspace_lock_table& locks,
      const failure_policy policy);

  restore_result restore(const quire::archive::extracted_archive& archive);

  /// Insert the folders of `folders.json` that the store lacks, ids
  /// preserved. `known` receives every folder id a workspace may reference.
  quire::common::status restore_folders(const std::filesystem::path& root,
                                        std::set<std::string>& known) const;

  /// Decode `{root}/{workspace_id}` without touching the store.
  quire::common::status read_workspace(const std::filesystem::path& root,
                                       const std::string& workspace_id,
                                       const std::set<std::string>& known,
                                       workspace_snapshot& out) const;

  /// Destroy and recreate one workspace. The caller holds its lock.
  quire::common::status restore_workspace(
      const quire::archive::extracted_archive& archive,
      const std::string& workspace_id,
      const std::set<std::string>& known,
      quire::schema::restored_payload_t& payload) const;

 private:
  void transition(restore_result& result, const restore_phase phase) const;

  const quire::storage::storage<quire::storage::rocksdb_storage_tag>& storage_;
  const quire::storage::blob_store& blobs_;
  workspace_lock_table& locks_;
  failure_policy policy_;
};

}  // namespace quire::restore
