#pragma once

#include <quire/common/status.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

#include <miniz.h>

namespace quire::archive {

/// True when an archive entry name stays inside the extraction root: relative,
/// `/` separated and free of `..` components.
bool is_safe_entry_name(const std::string_view name);

/// Streaming zip writer backed by miniz. Files are compressed straight from
/// disk; the central directory is written by `finalize`.
class zip_writer final {
 public:
  explicit zip_writer(const unsigned compression_level);
  zip_writer(const zip_writer&) = delete;
  zip_writer& operator=(const zip_writer&) = delete;
  ~zip_writer();

  quire::common::status open(const std::filesystem::path& path);

  /// Add an explicit directory entry (`name/`).
  quire::common::status add_directory(const std::string_view name);
  quire::common::status add_file(const std::string_view name,
                                 const std::filesystem::path& source);

  /// Add every directory and file below `root`, named relative to it, in
  /// lexicographic order.
  quire::common::status add_tree(const std::filesystem::path& root);

  quire::common::status finalize();

 private:
  quire::common::status failure(const std::string_view what) const;

  std::unique_ptr<mz_zip_archive> zip_;
  unsigned compression_level_;
  bool open_{false};
};

/// Zip reader backed by miniz.
class zip_reader final {
 public:
  zip_reader();
  zip_reader(const zip_reader&) = delete;
  zip_reader& operator=(const zip_reader&) = delete;
  ~zip_reader();

  /// Fails with `invalid_archive` when the file is missing or not a zip.
  quire::common::status open(const std::filesystem::path& path);

  /// Extract every entry below `destination`. Entries escaping the root,
  /// unsupported entries and archives whose uncompressed size exceeds
  /// `max_total_bytes` are rejected before anything is written.
  quire::common::status extract_all(const std::filesystem::path& destination,
                                    const uint64_t max_total_bytes);

 private:
  quire::common::status failure(const std::string_view what) const;

  std::unique_ptr<mz_zip_archive> zip_;
  bool open_{false};
};

}  // namespace quire::archive
