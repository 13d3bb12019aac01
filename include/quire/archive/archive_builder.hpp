#pragma once

#include <quire/archive/archive_stream.hpp>
#include <quire/common/status.hpp>
#include <quire/config/options.hpp>
#include <quire/schema/backup_request.hpp>
#include <quire/schema/manifest.hpp>
#include <quire/storage/blob_store.hpp>
#include <quire/storage/rocksdb/storage.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quire::archive {

/// Serializes the requested workspaces, every folder and the workspaces'
/// blob trees into one zip archive.
///
/// The archive is assembled in a scratch directory which the returned stream
/// owns. Any failure removes the scratch directory before returning.
class archive_builder final {
 public:
  archive_builder(
      const quire::storage::storage<quire::storage::rocksdb_storage_tag>&
          storage,
      const quire::storage::blob_store& blobs,
      const quire::config::options& options);

  /// Build an archive for `requests`, in request order. On failure returns
  /// std::nullopt and `result` explains why.
  std::optional<archive_stream> build(
      const std::vector<quire::schema::backup_request_t>& requests,
      quire::common::status& result) const;

 private:
  quire::common::status validate_requests(
      const std::vector<quire::schema::backup_request_t>& requests) const;
  quire::common::status write_manifest(
      const std::filesystem::path& content,
      const quire::schema::manifest_t& manifest) const;
  quire::common::status write_folders(
      const std::filesystem::path& content) const;
  quire::common::status write_workspace(
      const std::filesystem::path& content,
      const quire::schema::backup_request_t& request) const;
  quire::common::status compress(const std::filesystem::path& content,
                                 const std::filesystem::path& archive) const;

  const quire::storage::storage<quire::storage::rocksdb_storage_tag>& storage_;
  const quire::storage::blob_store& blobs_;
  const quire::config::options& options_;
};

/// `notebook_backup_{timestamp}.zip` with the ISO-8601 timestamp made safe
/// for file names.
std::string make_archive_file_name(
    const quire::schema::timestamp_milliseconds_t created_at);

}  // namespace quire::archive
