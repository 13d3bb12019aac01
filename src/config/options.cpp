#include <spdlog/spdlog.h>
#include <quire/config/options.hpp>

#include <fstream>
#include <system_error>

namespace po = boost::program_options;

using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::config {

options make_default_options() {
  auto o = options{};
  auto ec = std::error_code{};
  o.temp_root = std::filesystem::temp_directory_path(ec);
  if (ec) {
    spdlog::warn("System temp directory unavailable ({}), using '.'",
                 ec.message());
    o.temp_root = ".";
  }
  return o;
}

po::options_description describe_options(options& o) {
  auto description = po::options_description{"Store"};
  description.add_options()(
      "database",
      po::value<std::string>(&o.database_path)->default_value(o.database_path),
      "RocksDB directory holding workspaces, documents and notes")(
      "blob-root",
      po::value<std::string>()
          ->default_value(o.blob_root.string())
          ->notifier([&o](const std::string& value) { o.blob_root = value; }),
      "Root directory of the per-workspace blob trees")(
      "temp-root",
      po::value<std::string>()
          ->default_value(o.temp_root.string())
          ->notifier([&o](const std::string& value) { o.temp_root = value; }),
      "Parent directory of scratch directories")(
      "compression-level",
      po::value<unsigned>(&o.compression_level)
          ->default_value(o.compression_level),
      "zip compression level, 0 to 10")(
      "max-extracted-bytes",
      po::value<uint64_t>(&o.max_extracted_bytes)
          ->default_value(o.max_extracted_bytes),
      "Largest total uncompressed size accepted when restoring")(
      "failure-policy",
      po::value<std::string>()
          ->default_value(std::string{restore::to_string(o.on_failure)})
          ->notifier([&o](const std::string& value) {
            auto policy = restore::failure_policy_from_string(value);
            if (!policy) {
              throw po::validation_error(
                  po::validation_error::invalid_option_value,
                  "failure-policy", value);
            }
            o.on_failure = *policy;
          }),
      "abort or best_effort")(
      "remove-archive",
      po::value<bool>(&o.remove_archive_after_restore)
          ->default_value(o.remove_archive_after_restore),
      "Delete the uploaded archive after a restore");
  return description;
}

status validate_options(const options& o) {
  if (o.compression_level > kMaxCompressionLevel) {
    return make_error(error_code::invalid_configuration,
                      "compression level out of range",
                      std::to_string(o.compression_level));
  }
  if (o.max_extracted_bytes == 0) {
    return make_error(error_code::invalid_configuration,
                      "extraction limit must be positive");
  }
  if (o.database_path.empty() || o.blob_root.empty() || o.temp_root.empty()) {
    return make_error(error_code::invalid_configuration,
                      "database, blob root and temp root must be set");
  }
  return make_ok();
}

status load_config_file(const std::filesystem::path& path,
                        const po::options_description& description,
                        po::variables_map& vm) {
  auto in = std::ifstream{path};
  if (!in) {
    return make_error(error_code::io_failure, "failed to open config file",
                      path.string());
  }
  try {
    po::store(po::parse_config_file(in, description, true), vm);
  } catch (const po::error& e) {
    return make_error(error_code::invalid_configuration,
                      "invalid config file", path.string() + ": " + e.what());
  }
  spdlog::debug("Loaded configuration from '{}'", path.string());
  return make_ok();
}

}  // namespace quire::config
