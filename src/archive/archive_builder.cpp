#include <spdlog/spdlog.h>
#include <quire/archive/archive_builder.hpp>
#include <quire/archive/layout.hpp>
#include <quire/archive/zip.hpp>
#include <quire/schema/encoding/json/document.hpp>
#include <quire/schema/encoding/json/file.hpp>
#include <quire/schema/encoding/json/folder.hpp>
#include <quire/schema/encoding/json/manifest.hpp>
#include <quire/schema/encoding/json/note.hpp>
#include <quire/schema/encoding/json/workspace.hpp>

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

using namespace quire::schema;
using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace json = quire::schema::encoding::json;

namespace quire::archive {

namespace {

template <typename T>
Json::Value to_json_array(const std::vector<T>& rows) {
  auto value = Json::Value{Json::arrayValue};
  for (const auto& row : rows) {
    value.append(json::to_json(row));
  }
  return value;
}

status make_directory(const std::filesystem::path& path) {
  auto ec = std::error_code{};
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return make_error(error_code::io_failure, "failed to create directory",
                      path.string() + ": " + ec.message());
  }
  return make_ok();
}

}  // namespace

std::string make_archive_file_name(const timestamp_milliseconds_t created_at) {
  auto stamp = format_iso8601(created_at);
  std::replace_if(
      std::begin(stamp), std::end(stamp),
      [](const char c) { return c == ':' || c == '.'; }, '-');
  return std::string{layout::kArchiveNamePrefix} + stamp + ".zip";
}

archive_builder::archive_builder(
    const quire::storage::storage<quire::storage::rocksdb_storage_tag>&
        storage,
    const quire::storage::blob_store& blobs,
    const quire::config::options& options)
    : storage_{storage}, blobs_{blobs}, options_{options} {}

status archive_builder::validate_requests(
    const std::vector<backup_request_t>& requests) const {
  auto seen = std::set<std::string_view>{};
  for (const auto& request : requests) {
    if (!is_valid_id(request.workspace_id)) {
      return make_error(error_code::invalid_identifier,
                        "invalid workspace id", request.workspace_id);
    }
    if (!seen.insert(request.workspace_id).second) {
      return make_error(error_code::invalid_identifier,
                        "workspace requested more than once",
                        request.workspace_id);
    }
  }
  return make_ok();
}

status archive_builder::write_manifest(const std::filesystem::path& content,
                                       const manifest_t& manifest) const {
  return json::write_file(content / layout::kManifestFile,
                          json::to_json(manifest));
}

status archive_builder::write_folders(
    const std::filesystem::path& content) const {
  auto folders = std::vector<folder_t>{};
  auto listed = storage_.list_folders(folders);
  if (!listed) {
    return listed;
  }
  spdlog::debug("Writing {} folder(s) to archive", folders.size());
  return json::write_file(content / layout::kFoldersFile,
                          to_json_array(folders));
}

status archive_builder::write_workspace(
    const std::filesystem::path& content,
    const backup_request_t& request) const {
  const auto& id = request.workspace_id;

  auto workspace = std::optional<workspace_t>{};
  auto loaded = storage_.load_workspace(id, workspace);
  if (!loaded) {
    return loaded;
  }
  if (!workspace) {
    return make_error(error_code::workspace_missing,
                      "workspace not found in store", id);
  }

  auto documents = std::vector<document_t>{};
  auto listed = storage_.list_documents(id, documents);
  if (!listed) {
    return listed;
  }
  auto notes = std::vector<note_t>{};
  listed = storage_.list_notes(id, notes);
  if (!listed) {
    return listed;
  }

  const auto directory = content / id;
  auto written = make_directory(directory);
  if (written) {
    written = json::write_file(directory / layout::kMetadataFile,
                               json::to_json(*workspace));
  }
  if (written) {
    written = json::write_file(directory / layout::kDocumentsMetaFile,
                               to_json_array(documents));
  }
  if (written) {
    written = json::write_text_file(directory / layout::kLegacyNotesFile,
                                    request.legacy_payload);
  }
  if (written && !notes.empty()) {
    written = json::write_file(directory / layout::kNotepadNotesFile,
                               to_json_array(notes));
  }
  if (written) {
    written = blobs_.export_tree(id, directory);
  }
  if (!written) {
    return written;
  }

  spdlog::info("Added workspace '{}' ({} document(s), {} note(s))", id,
               documents.size(), notes.size());
  return make_ok();
}

status archive_builder::compress(const std::filesystem::path& content,
                                 const std::filesystem::path& archive) const {
  auto writer = zip_writer{options_.compression_level};
  auto result = writer.open(archive);
  if (result) {
    result = writer.add_tree(content);
  }
  if (result) {
    result = writer.finalize();
  }
  return result;
}

std::optional<archive_stream> archive_builder::build(
    const std::vector<backup_request_t>& requests,
    status& result) const {
  result = validate_requests(requests);
  if (!result) {
    spdlog::warn("Rejected backup request: {} ({})", result.log, result.info);
    return std::nullopt;
  }

  auto workspace =
      temp_workspace::acquire(options_.temp_root, layout::kBuildPrefix, result);
  if (!workspace) {
    spdlog::error("Failed to prepare backup directory: {}", result.info);
    return std::nullopt;
  }

  const auto created_at = now_milliseconds();
  auto manifest = manifest_t{};
  manifest.created_at = format_iso8601(created_at);
  for (const auto& request : requests) {
    manifest.workspace_ids.push_back(request.workspace_id);
  }

  // `workspace` goes out of scope on every early return below, taking the
  // partial archive tree with it.
  const auto content = workspace->path() / layout::kContentDirectory;
  result = make_directory(content);
  if (result) {
    result = write_manifest(content, manifest);
  }
  if (result) {
    result = write_folders(content);
  }
  for (const auto& request : requests) {
    if (!result) {
      break;
    }
    result = write_workspace(content, request);
  }
  const auto archive_path = workspace->path() / layout::kArchiveFile;
  if (result) {
    result = compress(content, archive_path);
  }
  if (!result) {
    spdlog::error("Backup failed: {} ({})", result.log, result.info);
    return std::nullopt;
  }

  // The archive is all the stream needs; drop the expanded tree now.
  auto ec = std::error_code{};
  std::filesystem::remove_all(content, ec);
  if (ec) {
    spdlog::warn("Failed to prune backup content '{}': {}", content.string(),
                 ec.message());
  }

  spdlog::info("Created backup of {} workspace(s)", requests.size());
  return archive_stream{std::move(*workspace), archive_path,
                        make_archive_file_name(created_at)};
}

}  // namespace quire::archive
