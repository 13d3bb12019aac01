#pragma once

#include <quire/archive/temp_workspace.hpp>
#include <quire/common/status.hpp>
#include <quire/config/options.hpp>
#include <quire/schema/manifest.hpp>
#include <filesystem>
#include <optional>

namespace quire::archive {

/// Archive unpacked into a scratch directory, with its validated manifest.
/// Destroying it removes the extracted tree.
struct extracted_archive final {
  temp_workspace workspace;
  quire::schema::manifest_t manifest;
  /// Read from `backup_manifest.json`; each workspace's `documents`
  /// directory then holds its whole blob root.
  bool legacy_layout{false};

  const std::filesystem::path& root() const { return workspace.path(); }
};

/// Unpacks an uploaded archive and validates it before anything downstream
/// touches the store.
class archive_extractor final {
 public:
  explicit archive_extractor(const quire::config::options& options);

  /// Extract and validate `archive`. Every failure is a validation error and
  /// leaves no scratch directory behind.
  std::optional<extracted_archive> extract(
      const std::filesystem::path& archive,
      quire::common::status& result) const;

 private:
  const quire::config::options& options_;
};

/// Read `manifest.json`, falling back to the legacy `backup_manifest.json`.
quire::common::status read_manifest(const std::filesystem::path& root,
                                    quire::schema::manifest_t& out,
                                    bool& legacy);

/// Reject manifests whose major format version is newer than this build.
quire::common::status check_format_version(
    const quire::schema::manifest_t& manifest);

/// The workspace directories present under `root` must be exactly the
/// manifest's workspace ids, each a valid id listed once.
quire::common::status validate_layout(
    const std::filesystem::path& root,
    const quire::schema::manifest_t& manifest);

}  // namespace quire::archive
