#include <spdlog/spdlog.h>
#include <quire/archive/archive_extractor.hpp>
#include <quire/archive/layout.hpp>
#include <quire/archive/zip.hpp>
#include <quire/schema/encoding/json/file.hpp>
#include <quire/schema/encoding/json/manifest.hpp>

#include <charconv>
#include <set>
#include <string>
#include <system_error>
#include <utility>

using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;
using quire::schema::manifest_t;

namespace json = quire::schema::encoding::json;

namespace quire::archive {

namespace {

std::optional<uint32_t> major_version(const std::string_view version) {
  auto major = uint32_t{};
  const auto* begin = version.data();
  const auto* end = version.data() + version.size();
  auto [next, ec] = std::from_chars(begin, end, major);
  if (ec != std::errc{} || next == begin || (next != end && *next != '.')) {
    return std::nullopt;
  }
  return major;
}

}  // namespace

status read_manifest(const std::filesystem::path& root,
                     manifest_t& out,
                     bool& legacy) {
  auto ec = std::error_code{};
  auto path = root / layout::kManifestFile;
  legacy = false;
  if (!std::filesystem::is_regular_file(path, ec)) {
    path = root / layout::kLegacyManifestFile;
    legacy = true;
    if (!std::filesystem::is_regular_file(path, ec)) {
      return make_error(error_code::manifest_missing,
                        "backup archive has no manifest.json");
    }
    spdlog::info("Reading legacy manifest '{}'", layout::kLegacyManifestFile);
  }

  auto error = std::string{};
  auto value = json::read_file(path, error);
  if (!value) {
    return make_error(error_code::manifest_invalid,
                      "failed to parse manifest", error);
  }
  auto decoded = legacy ? json::from_legacy_json(*value, out, error)
                        : json::from_json(*value, out, error);
  if (!decoded) {
    return make_error(error_code::manifest_invalid, "malformed manifest",
                      error);
  }
  return make_ok();
}

status check_format_version(const manifest_t& manifest) {
  auto major = major_version(manifest.format_version);
  if (!major) {
    return make_error(error_code::manifest_invalid,
                      "unreadable manifest format version",
                      manifest.format_version);
  }
  if (*major > quire::schema::kManifestSupportedMajor) {
    return make_error(error_code::unsupported_format_version,
                      "archive was written by a newer format version",
                      manifest.format_version);
  }
  return make_ok();
}

status validate_layout(const std::filesystem::path& root,
                       const manifest_t& manifest) {
  auto listed = std::set<std::string>{};
  for (const auto& id : manifest.workspace_ids) {
    if (!quire::schema::is_valid_id(id)) {
      return make_error(error_code::invalid_identifier,
                        "manifest lists an invalid workspace id", id);
    }
    if (!listed.insert(id).second) {
      return make_error(error_code::manifest_invalid,
                        "manifest lists a workspace more than once", id);
    }
  }

  auto present = std::set<std::string>{};
  auto ec = std::error_code{};
  for (auto it = std::filesystem::directory_iterator{root, ec};
       !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (it->is_directory(ec)) {
      present.insert(it->path().filename().string());
    }
  }
  if (ec) {
    return make_error(error_code::io_failure,
                      "failed to list extracted archive",
                      root.string() + ": " + ec.message());
  }

  for (const auto& id : listed) {
    if (!present.contains(id)) {
      return make_error(error_code::manifest_content_mismatch,
                        "workspace listed in manifest is missing", id);
    }
  }
  for (const auto& name : present) {
    if (!listed.contains(name)) {
      return make_error(error_code::manifest_content_mismatch,
                        "archive contains a workspace not in the manifest",
                        name);
    }
  }
  return make_ok();
}

archive_extractor::archive_extractor(const quire::config::options& options)
    : options_{options} {}

std::optional<extracted_archive> archive_extractor::extract(
    const std::filesystem::path& archive,
    status& result) const {
  auto reader = zip_reader{};
  result = reader.open(archive);
  if (!result) {
    return std::nullopt;
  }

  auto workspace = temp_workspace::acquire(options_.temp_root,
                                           layout::kExtractPrefix, result);
  if (!workspace) {
    return std::nullopt;
  }

  result = reader.extract_all(workspace->path(), options_.max_extracted_bytes);
  if (!result) {
    return std::nullopt;
  }

  auto manifest = manifest_t{};
  auto legacy = false;
  result = read_manifest(workspace->path(), manifest, legacy);
  if (result) {
    result = check_format_version(manifest);
  }
  if (result) {
    result = validate_layout(workspace->path(), manifest);
  }
  if (!result) {
    spdlog::warn("Rejected archive '{}': {} ({})", archive.string(),
                 result.log, result.info);
    return std::nullopt;
  }

  spdlog::info("Extracted archive '{}' with {} workspace(s), format {}",
               archive.string(), manifest.workspace_ids.size(),
               manifest.format_version);
  return extracted_archive{.workspace = std::move(*workspace),
                           .manifest = std::move(manifest),
                           .legacy_layout = legacy};
}

}  // namespace quire::archive
