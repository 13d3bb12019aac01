#pragma once

#include <quire/archive/temp_workspace.hpp>
#include <quire/common/status.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace quire::archive {

/// Readable handle over a finished archive.
///
/// The stream owns the scratch directory the archive was built in. Reaching
/// end of stream, calling `close` or destroying the stream removes it, so
/// callers only have to consume or drop the handle.
class archive_stream final {
 public:
  archive_stream(temp_workspace workspace,
                 std::filesystem::path archive_path,
                 std::string file_name);
  archive_stream(archive_stream&&) noexcept = default;
  archive_stream& operator=(archive_stream&&) noexcept = default;
  ~archive_stream();

  /// Suggested download name, `notebook_backup_{timestamp}.zip`.
  const std::string& file_name() const;
  std::string_view content_type() const;
  uint64_t size() const;

  /// Read up to `buffer.size()` bytes. Returns 0 once the archive is
  /// exhausted, at which point the scratch directory is already gone.
  std::size_t read(std::span<char> buffer);

  /// Drain the remaining bytes into `out` and close the stream.
  quire::common::status copy_to(std::ostream& out);

  bool closed() const;
  void close() noexcept;

 private:
  temp_workspace workspace_;
  std::filesystem::path archive_path_;
  std::string file_name_;
  uint64_t size_{};
  std::unique_ptr<std::ifstream> input_;
};

}  // namespace quire::archive
