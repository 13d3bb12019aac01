#pragma once

#include <quire/archive/temp_workspace.hpp>
#include <quire/common/status.hpp>
#include <quire/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

namespace quire::storage {

/// Sub-trees of a workspace's blob root. Archives use the same names.
enum class blob_kind : uint8_t { documents = 0, notes = 1, vectors = 2 };

inline constexpr auto kBlobKindMappings = std::array{
    std::pair<std::string_view, blob_kind>{"documents", blob_kind::documents},
    std::pair<std::string_view, blob_kind>{"notes", blob_kind::notes},
    std::pair<std::string_view, blob_kind>{"vectors", blob_kind::vectors},
};

inline constexpr std::string_view to_string(const blob_kind kind) {
  return quire::schema::to_string(kind, kBlobKindMappings).value_or("unknown");
}

/// Holds staging and retired trees under the blob root. Workspace ids never
/// start with '.', so it cannot collide with a workspace tree.
inline constexpr auto kReservedDirectory = std::string_view{".quire"};

/// Filesystem side of the workspace store: `{root}/{workspaceId}/{kind}/...`.
///
/// Blob trees cannot join a RocksDB write batch, so replacement goes through
/// a staging directory under `{root}/.quire` that is swapped in once the rows
/// are committed.
class blob_store final {
 public:
  explicit blob_store(std::filesystem::path root);

  const std::filesystem::path& root() const;
  std::filesystem::path reserved_root() const;
  std::filesystem::path workspace_root(
      const std::string_view workspace_id) const;
  bool has_workspace(const std::string_view workspace_id) const;

  /// Copy the present sub-trees of a workspace into `destination/{kind}`.
  /// A missing sub-tree is logged and skipped.
  quire::common::status export_tree(
      const std::string_view workspace_id,
      const std::filesystem::path& destination) const;

  /// Acquire an empty staging directory under the reserved directory.
  std::optional<quire::archive::temp_workspace> begin_staging(
      const std::string_view workspace_id,
      quire::common::status& result) const;

  /// Copy the present sub-trees of `source` into the staging directory.
  /// Absent sub-trees are optional and skipped.
  quire::common::status stage_tree(
      const std::filesystem::path& source,
      const quire::archive::temp_workspace& staging) const;

  /// Stage a workspace directory of a legacy archive, whose `documents`
  /// directory is a copy of the whole blob root. Its `notes` and `vectors`
  /// children move to their own sub-trees and everything else lands in
  /// `documents`. Top level `notes` and `vectors` directories win.
  quire::common::status stage_legacy_tree(
      const std::filesystem::path& source,
      const quire::archive::temp_workspace& staging) const;

  /// Replace the workspace's blob root with the staged tree.
  quire::common::status install(const std::string_view workspace_id,
                                quire::archive::temp_workspace& staging) const;

  /// Remove the workspace's blob root. Absence is not an error.
  quire::common::status remove_workspace(
      const std::string_view workspace_id) const;

 private:
  std::filesystem::path root_;
};

/// Recursively copy `source` into `destination`, creating it first.
quire::common::status copy_tree(const std::filesystem::path& source,
                                const std::filesystem::path& destination);

}  // namespace quire::storage
