#include <spdlog/spdlog.h>
#include <quire/archive/layout.hpp>
#include <quire/restore/orchestrator.hpp>
#include <quire/schema/encoding/json/document.hpp>
#include <quire/schema/encoding/json/file.hpp>
#include <quire/schema/encoding/json/folder.hpp>
#include <quire/schema/encoding/json/note.hpp>
#include <quire/schema/encoding/json/workspace.hpp>

#include <iterator>
#include <optional>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

using namespace quire::schema;
using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace json = quire::schema::encoding::json;
namespace layout = quire::archive::layout;

namespace quire::restore {

namespace {

bool file_exists(const std::filesystem::path& path) {
  auto ec = std::error_code{};
  return std::filesystem::is_regular_file(path, ec);
}

// Decode an optional JSON array of child rows owned by `workspace_id`.
template <typename T>
status read_child_rows(const std::filesystem::path& path,
                       const std::string& workspace_id,
                       std::vector<T>& out) {
  out.clear();
  if (!file_exists(path)) {
    spdlog::warn("Workspace '{}' has no {}, restoring without it",
                 workspace_id, path.filename().string());
    return make_ok();
  }
  auto error = std::string{};
  auto value = json::read_file(path, error);
  if (!value) {
    return make_error(error_code::metadata_invalid,
                      "failed to parse workspace rows", error);
  }
  if (!value->isArray()) {
    return make_error(error_code::metadata_invalid,
                      "workspace rows are not an array", path.string());
  }
  out.reserve(value->size());
  for (const auto& entry : *value) {
    auto row = T{};
    if (!json::from_json(entry, row, error)) {
      return make_error(error_code::metadata_invalid, "malformed row",
                        path.filename().string() + ": " + error);
    }
    if (!is_valid_id(row.id)) {
      return make_error(error_code::invalid_identifier, "invalid row id",
                        path.filename().string() + ": " + row.id);
    }
    row.workspace_id = workspace_id;
    out.push_back(std::move(row));
  }
  return make_ok();
}

}  // namespace

orchestrator::orchestrator(
    const quire::storage::storage<quire::storage::rocksdb_storage_tag>&
        storage,
    const quire::storage::blob_store& blobs,
    workspace_lock_table& locks,
    const failure_policy policy)
    : storage_{storage}, blobs_{blobs}, locks_{locks}, policy_{policy} {}

void orchestrator::transition(restore_result& result,
                              const restore_phase phase) const {
  spdlog::debug("Restore phase {} -> {}", to_string(result.phase),
                to_string(phase));
  result.phase = phase;
}

status orchestrator::restore_folders(const std::filesystem::path& root,
                                     std::set<std::string>& known) const {
  known.clear();
  const auto path = root / layout::kFoldersFile;
  if (!file_exists(path)) {
    spdlog::warn("No {} in archive, folder references will be cleared",
                 layout::kFoldersFile);
    return make_ok();
  }

  auto error = std::string{};
  auto value = json::read_file(path, error);
  if (!value || !value->isArray()) {
    return make_error(error_code::metadata_invalid, "failed to read folders",
                      value ? std::string{"folders.json is not an array"}
                            : error);
  }

  auto folders = std::vector<folder_t>{};
  for (const auto& entry : *value) {
    auto folder = folder_t{};
    if (!json::from_json(entry, folder, error) || !is_valid_id(folder.id)) {
      spdlog::warn("Skipping unreadable folder entry: {}",
                   error.empty() ? folder.id : error);
      error.clear();
      continue;
    }
    folders.push_back(std::move(folder));
  }

  auto archived = std::set<std::string>{};
  for (const auto& folder : folders) {
    archived.insert(folder.id);
  }

  auto restored = 0u;
  const auto restore_one = [&](folder_t& folder) {
    auto existing = std::optional<folder_t>{};
    auto loaded = storage_.load_folder(folder.id, existing);
    if (!loaded) {
      spdlog::error("Failed to look up folder '{}': {}", folder.id,
                    loaded.info);
      return;
    }
    if (existing) {
      spdlog::debug("Folder '{}' already exists, keeping it", folder.id);
      known.insert(folder.id);
      return;
    }

    // Parents are handled first, so an unknown parent is either absent or
    // failed to restore.
    if (folder.parent_id && !known.contains(*folder.parent_id)) {
      auto parent = std::optional<folder_t>{};
      auto parent_loaded = storage_.load_folder(*folder.parent_id, parent);
      if (!parent_loaded || !parent) {
        spdlog::warn("Folder '{}' references missing parent '{}', clearing it",
                     folder.id, *folder.parent_id);
        folder.parent_id.reset();
      }
    }

    auto saved = storage_.save_folder(folder);
    if (!saved) {
      spdlog::error("Failed to restore folder '{}': {}", folder.id,
                    saved.info);
      return;
    }
    spdlog::info("Restored folder '{}' ({})", folder.id, folder.name);
    known.insert(folder.id);
    ++restored;
  };

  auto visited = std::set<std::string>{};
  auto pending = std::move(folders);
  while (!pending.empty()) {
    auto deferred = std::vector<folder_t>{};
    for (auto& folder : pending) {
      if (folder.parent_id && *folder.parent_id != folder.id &&
          archived.contains(*folder.parent_id) &&
          !visited.contains(*folder.parent_id)) {
        deferred.push_back(std::move(folder));
        continue;
      }
      restore_one(folder);
      visited.insert(folder.id);
    }
    if (deferred.size() == pending.size()) {
      // Parent cycle; restoring one member clears its parent and frees the
      // rest.
      restore_one(deferred.front());
      visited.insert(deferred.front().id);
      deferred.erase(std::begin(deferred));
    }
    pending = std::move(deferred);
  }
  spdlog::info("Folder pass done: {} restored, {} known", restored,
               known.size());
  return make_ok();
}

status orchestrator::read_workspace(const std::filesystem::path& root,
                                    const std::string& workspace_id,
                                    const std::set<std::string>& known,
                                    workspace_snapshot& out) const {
  const auto directory = root / workspace_id;
  const auto metadata_path = directory / layout::kMetadataFile;
  if (!file_exists(metadata_path)) {
    return make_error(error_code::metadata_missing,
                      "workspace metadata.json is missing", workspace_id);
  }

  auto error = std::string{};
  auto metadata = json::read_file(metadata_path, error);
  if (!metadata) {
    return make_error(error_code::metadata_invalid,
                      "failed to parse workspace metadata", error);
  }
  if (!json::from_json(*metadata, out.workspace, error)) {
    return make_error(error_code::metadata_invalid,
                      "malformed workspace metadata",
                      workspace_id + ": " + error);
  }
  if (out.workspace.id != workspace_id) {
    return make_error(error_code::workspace_id_mismatch,
                      "metadata id does not match its directory",
                      out.workspace.id + " != " + workspace_id);
  }
  if (out.workspace.folder_id && !known.contains(*out.workspace.folder_id)) {
    spdlog::warn("Workspace '{}' references unknown folder '{}', clearing it",
                 workspace_id, *out.workspace.folder_id);
    out.workspace.folder_id.reset();
  }

  auto result = read_child_rows(directory / layout::kDocumentsMetaFile,
                                workspace_id, out.documents);
  if (result) {
    result = read_child_rows(directory / layout::kNotepadNotesFile,
                             workspace_id, out.notes);
  }
  if (!result) {
    return result;
  }

  const auto legacy_path = directory / layout::kLegacyNotesFile;
  if (file_exists(legacy_path)) {
    auto payload = json::read_text_file(legacy_path, error);
    if (!payload) {
      return make_error(error_code::io_failure,
                        "failed to read legacy notes", error);
    }
    out.legacy_payload = std::move(*payload);
  } else {
    spdlog::warn("Workspace '{}' has no {}, returning an empty payload",
                 workspace_id, layout::kLegacyNotesFile);
    out.legacy_payload = std::string{kEmptyLegacyPayload};
  }
  return make_ok();
}

status orchestrator::restore_workspace(
    const quire::archive::extracted_archive& archive,
    const std::string& workspace_id,
    const std::set<std::string>& known,
    restored_payload_t& payload) const {
  const auto& root = archive.root();
  auto snapshot = workspace_snapshot{};
  auto result = read_workspace(root, workspace_id, known, snapshot);
  if (!result) {
    return result;
  }

  auto staging = blobs_.begin_staging(workspace_id, result);
  if (!staging) {
    return result;
  }
  result = archive.legacy_layout
               ? blobs_.stage_legacy_tree(root / workspace_id, *staging)
               : blobs_.stage_tree(root / workspace_id, *staging);
  if (!result) {
    return result;
  }

  auto batch =
      quire::storage::write_batch<quire::storage::rocksdb_storage_tag>{};
  auto existed = false;
  result = storage_.stage_destroy_workspace(batch, workspace_id, existed);
  if (result) {
    result = storage_.stage_workspace(batch, snapshot.workspace);
  }
  for (const auto& document : snapshot.documents) {
    if (!result) {
      break;
    }
    result = storage_.stage_document(batch, document);
  }
  for (const auto& note : snapshot.notes) {
    if (!result) {
      break;
    }
    result = storage_.stage_note(batch, note);
  }
  if (result) {
    result = storage_.commit(batch);
  }
  if (!result) {
    spdlog::error("Failed to restore rows of workspace '{}': {}", workspace_id,
                  result.info);
    return result;
  }
  if (!existed) {
    spdlog::debug("Workspace '{}' did not exist before restore", workspace_id);
  }

  result = blobs_.install(workspace_id, *staging);
  if (!result) {
    spdlog::error("Rows of workspace '{}' were restored but its blob tree "
                  "was not installed",
                  workspace_id);
    return result;
  }

  payload = restored_payload_t{.workspace_id = workspace_id,
                               .payload = std::move(snapshot.legacy_payload)};
  spdlog::info("Restored workspace '{}' ({} document(s), {} note(s))",
               workspace_id, snapshot.documents.size(), snapshot.notes.size());
  return make_ok();
}

restore_result orchestrator::restore(
    const quire::archive::extracted_archive& archive) {
  auto result = restore_result{};
  const auto& ids = archive.manifest.workspace_ids;

  transition(result, restore_phase::restoring_folders);
  auto known = std::set<std::string>{};
  result.status = restore_folders(archive.root(), known);
  if (!result.status) {
    transition(result, restore_phase::failed);
    result.message = "Restore failed: " + result.status.log;
    return result;
  }

  transition(result, restore_phase::restoring_workspaces);
  auto failures = std::size_t{};
  for (const auto& id : ids) {
    auto lock = locks_.lock(id);
    auto payload = restored_payload_t{};
    auto outcome = restore_workspace(archive, id, known, payload);
    result.workspace_results.push_back(
        workspace_result{.workspace_id = id, .status = outcome});
    if (outcome) {
      result.restored_payloads.push_back(std::move(payload));
      continue;
    }

    ++failures;
    if (result.status) {
      result.status = outcome;
    }
    if (policy_ == failure_policy::abort) {
      transition(result, restore_phase::failed);
      result.message = "Restore aborted at workspace '" + id +
                       "': " + outcome.log;
      return result;
    }
    spdlog::warn("Continuing after failed workspace '{}': {}", id,
                 outcome.log);
  }

  transition(result, restore_phase::completed);
  if (failures == 0) {
    result.message = "Backup restored successfully";
  } else {
    result.message = "Restored " +
                     std::to_string(ids.size() - failures) + " of " +
                     std::to_string(ids.size()) + " workspace(s)";
  }
  spdlog::info("{}", result.message);
  return result;
}

}  // namespace quire::restore
