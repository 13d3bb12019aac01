#pragma once

#include <quire/archive/archive_stream.hpp>
#include <quire/common/status.hpp>
#include <quire/config/options.hpp>
#include <quire/restore/orchestrator.hpp>
#include <quire/restore/workspace_lock.hpp>
#include <quire/schema/backup_request.hpp>
#include <quire/storage/blob_store.hpp>
#include <quire/storage/rocksdb/storage.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace quire::backup {

/// Entry point for the surrounding application.
///
/// Owns the configuration and the per-workspace restore locks; the store is
/// borrowed and must outlive the service. Backups may run concurrently with
/// each other and with restores of other workspaces.
class service final {
 public:
  service(quire::storage::storage<quire::storage::rocksdb_storage_tag>& storage,
          quire::config::options options);

  /// Snapshot the requested workspaces into a zip archive. The returned
  /// stream owns its scratch directory; consume or close it.
  std::optional<quire::archive::archive_stream> create_backup(
      const std::vector<quire::schema::backup_request_t>& requests,
      quire::common::status& result) const;

  /// Validate, then restore, the archive at `archive_path`. The archive file
  /// is deleted afterwards when `remove_archive_after_restore` is set.
  quire::restore::restore_result restore_from_backup(
      const std::filesystem::path& archive_path);

  const quire::config::options& options() const;
  const quire::storage::blob_store& blobs() const;

 private:
  void discard_upload(const std::filesystem::path& archive_path) const;

  quire::storage::storage<quire::storage::rocksdb_storage_tag>& storage_;
  quire::config::options options_;
  quire::storage::blob_store blobs_;
  quire::restore::workspace_lock_table locks_;
};

}  // namespace quire::backup
