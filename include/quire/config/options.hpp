#pragma once

#include <quire/common/status.hpp>
#include <quire/restore/failure_policy.hpp>
#include <boost/program_options.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace quire::config {

inline constexpr auto kDefaultCompressionLevel = 9u;
inline constexpr auto kMaxCompressionLevel = 10u;
inline constexpr auto kDefaultMaxExtractedBytes = uint64_t{4} << 30;

/// Runtime settings of the backup service.
struct options final {
  /// RocksDB directory holding the workspace keyspace.
  std::string database_path{"quire.db"};
  /// Root of the per-workspace blob trees.
  std::filesystem::path blob_root{"uploads"};
  /// Parent of every scratch directory.
  std::filesystem::path temp_root;
  /// zip deflate level, 0 (store) to 10.
  unsigned compression_level{kDefaultCompressionLevel};
  /// Upper bound on the uncompressed size of an archive being restored.
  uint64_t max_extracted_bytes{kDefaultMaxExtractedBytes};
  restore::failure_policy on_failure{restore::failure_policy::abort};
  /// Delete the uploaded archive once a restore finishes, whatever its outcome.
  bool remove_archive_after_restore{true};
};

/// Defaults with `temp_root` set to the system temp directory.
options make_default_options();

/// Describe every setting of `o` for boost::program_options. Notifiers write
/// parsed values straight into `o`; an unknown failure policy raises
/// `boost::program_options::validation_error`.
boost::program_options::options_description describe_options(options& o);

/// Range checks that the option parser cannot express.
quire::common::status validate_options(const options& o);

/// Store the settings of an INI style file (`key = value`, keys as in
/// `describe_options`) into `vm`. Values already stored from the command line
/// take precedence.
quire::common::status load_config_file(
    const std::filesystem::path& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

}  // namespace quire::config
