#pragma once

#include <quire/common/status.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace quire::archive {

/// Uniquely named scratch directory owned by exactly one operation.
///
/// The directory is created by `acquire` and removed by `release`, which the
/// destructor calls, so every exit path of the owning scope cleans up. The
/// handle is move-only; a moved-from handle owns nothing.
class temp_workspace final {
 public:
  /// Create `{root}/{prefix}-{16 hex}`. On failure returns std::nullopt and
  /// `result` carries an `io_failure` status.
  static std::optional<temp_workspace> acquire(
      const std::filesystem::path& root,
      const std::string_view prefix,
      quire::common::status& result);

  temp_workspace(const temp_workspace&) = delete;
  temp_workspace& operator=(const temp_workspace&) = delete;
  temp_workspace(temp_workspace&& other) noexcept;
  temp_workspace& operator=(temp_workspace&& other) noexcept;
  ~temp_workspace();

  const std::filesystem::path& path() const;
  bool released() const;

  /// Remove the directory tree. Filesystem errors are logged, never thrown.
  /// Calling it more than once is a no-op.
  void release() noexcept;

  /// Move the directory to `target` (which must not exist) and give up
  /// ownership of it.
  quire::common::status persist(const std::filesystem::path& target);

 private:
  explicit temp_workspace(std::filesystem::path path);

  std::filesystem::path path_;
  bool released_{false};
};

/// Remove every scratch directory still owned by a live handle. Used by the
/// signal path, where destructors will not run.
std::size_t release_all_temp_directories() noexcept;

/// Number of scratch directories currently owned by live handles.
std::size_t live_temp_directory_count();

}  // namespace quire::archive
