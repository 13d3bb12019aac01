#include <spdlog/spdlog.h>
#include <quire/schema/encoding/scale/encoder.hpp>
#include <quire/schema/key/store_keys.hpp>
#include <quire/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

using namespace quire::schema;
using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::storage {

namespace {

namespace scale_rows = quire::schema::encoding::scale;

status not_open() {
  return make_error(error_code::store_failure,
                    "RocksDB database is not initialized");
}

template <typename Row, typename T>
bool decode_row(const ROCKSDB_NAMESPACE::Slice& value, T& out) {
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<Row>(bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    return false;
  }
  out = scale_rows::from_row(std::move(decoded.value()));
  return true;
}

template <typename Row, typename T>
status scan_rows(const ROCKSDB_NAMESPACE::DB& database,
                 const bytes_t& prefix,
                 std::vector<T>& out) {
  out.clear();
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      const_cast<ROCKSDB_NAMESPACE::DB&>(database).NewIterator(
          ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto row = T{};
    if (!decode_row<Row>(iterator->value(), row)) {
      spdlog::error("Failed decoding row for key '{}'", std::string{key_view});
      return make_error(error_code::store_failure, "failed to decode row",
                        std::string{key_view});
    }
    out.push_back(std::move(row));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    return make_error(error_code::store_failure, "failed to scan keyspace",
                      iterator->status().ToString());
  }
  return make_ok();
}

template <typename T>
status encode_row(const T& value, bytes_t& out) {
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(scale_rows::to_row(value));
  if (!encoded) {
    return make_error(error_code::store_failure, "failed to encode row",
                      value.id);
  }
  out = std::move(encoded.value());
  return make_ok();
}

}  // namespace

bool storage<rocksdb_storage_tag>::is_open() const {
  return database != nullptr;
}

status storage<rocksdb_storage_tag>::get_raw(
    const bytes_t& key,
    std::optional<std::string>& out) const {
  out.reset();
  if (!database) {
    return not_open();
  }
  auto value = std::string{};
  auto result = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (result.IsNotFound()) {
    return make_ok();
  }
  if (!result.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", result.ToString());
    return make_error(error_code::store_failure,
                      "failed to read from the store", result.ToString());
  }
  out = std::move(value);
  return make_ok();
}

status storage<rocksdb_storage_tag>::load_folder(
    const std::string_view& folder_id,
    std::optional<folder_t>& out) const {
  out.reset();
  auto raw = std::optional<std::string>{};
  auto result = get_raw(key::make_folder_key(folder_id), raw);
  if (!result || !raw) {
    return result;
  }
  auto folder = folder_t{};
  if (!decode_row<scale_rows::folder_row_t>(ROCKSDB_NAMESPACE::Slice{*raw},
                                            folder)) {
    return make_error(error_code::store_failure, "failed to decode folder",
                      std::string{folder_id});
  }
  out = std::move(folder);
  return make_ok();
}

status storage<rocksdb_storage_tag>::list_folders(
    std::vector<folder_t>& out) const {
  if (!database) {
    return not_open();
  }
  return scan_rows<scale_rows::folder_row_t>(
      *database, make_bytes(key::kFolderKeyPrefix), out);
}

status storage<rocksdb_storage_tag>::load_workspace(
    const std::string_view& workspace_id,
    std::optional<workspace_t>& out) const {
  out.reset();
  auto raw = std::optional<std::string>{};
  auto result = get_raw(key::make_workspace_key(workspace_id), raw);
  if (!result || !raw) {
    return result;
  }
  auto workspace = workspace_t{};
  if (!decode_row<scale_rows::workspace_row_t>(ROCKSDB_NAMESPACE::Slice{*raw},
                                               workspace)) {
    return make_error(error_code::store_failure, "failed to decode workspace",
                      std::string{workspace_id});
  }
  out = std::move(workspace);
  return make_ok();
}

status storage<rocksdb_storage_tag>::list_workspaces(
    std::vector<workspace_t>& out) const {
  if (!database) {
    return not_open();
  }
  return scan_rows<scale_rows::workspace_row_t>(
      *database, make_bytes(key::kWorkspaceKeyPrefix), out);
}

status storage<rocksdb_storage_tag>::list_documents(
    const std::string_view& workspace_id,
    std::vector<document_t>& out) const {
  if (!database) {
    return not_open();
  }
  return scan_rows<scale_rows::document_row_t>(
      *database, key::make_document_prefix(workspace_id), out);
}

status storage<rocksdb_storage_tag>::list_notes(
    const std::string_view& workspace_id,
    std::vector<note_t>& out) const {
  if (!database) {
    return not_open();
  }
  return scan_rows<scale_rows::note_row_t>(
      *database, key::make_note_prefix(workspace_id), out);
}

status storage<rocksdb_storage_tag>::save_folder(const folder_t& folder) const {
  if (!database) {
    return not_open();
  }
  auto value = bytes_t{};
  auto encoded = encode_row(folder, value);
  if (!encoded) {
    return encoded;
  }
  auto result = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key::make_folder_key(folder.id)),
                              detail::to_slice(value));
  if (!result.ok()) {
    spdlog::error("Failed to put folder '{}' into RocksDB: {}", folder.id,
                  result.ToString());
    return make_error(error_code::store_failure, "failed to save folder",
                      result.ToString());
  }
  return make_ok();
}

status storage<rocksdb_storage_tag>::stage_put(
    write_batch<rocksdb_storage_tag>& batch,
    const bytes_t& key,
    const bytes_t& value) const {
  auto result = batch.batch.Put(detail::to_slice(key), detail::to_slice(value));
  if (!result.ok()) {
    return make_error(error_code::store_failure, "failed to stage write",
                      result.ToString());
  }
  ++batch.operations;
  return make_ok();
}

status storage<rocksdb_storage_tag>::stage_destroy_workspace(
    write_batch<rocksdb_storage_tag>& batch,
    const std::string_view& workspace_id,
    bool& existed) const {
  existed = false;
  if (!database) {
    return not_open();
  }

  // Dependency order: notes, documents, then the workspace row.
  for (const auto& prefix : {key::make_note_prefix(workspace_id),
                             key::make_document_prefix(workspace_id)}) {
    auto entries = std::vector<key_value_entry_t>{};
    auto scanned = list_by_prefix(make_bytes_view(prefix), entries);
    if (!scanned) {
      return scanned;
    }
    for (const auto& [key, value] : entries) {
      auto result = batch.batch.Delete(detail::to_slice(key));
      if (!result.ok()) {
        return make_error(error_code::store_failure,
                          "failed to stage delete", result.ToString());
      }
      ++batch.operations;
    }
  }

  auto workspace_key = key::make_workspace_key(workspace_id);
  auto raw = std::optional<std::string>{};
  auto lookup = get_raw(workspace_key, raw);
  if (!lookup) {
    return lookup;
  }
  existed = raw.has_value();
  if (existed) {
    auto result = batch.batch.Delete(detail::to_slice(workspace_key));
    if (!result.ok()) {
      return make_error(error_code::store_failure, "failed to stage delete",
                        result.ToString());
    }
    ++batch.operations;
  }
  return make_ok();
}

status storage<rocksdb_storage_tag>::stage_workspace(
    write_batch<rocksdb_storage_tag>& batch,
    const workspace_t& workspace) const {
  auto value = bytes_t{};
  auto encoded = encode_row(workspace, value);
  if (!encoded) {
    return encoded;
  }
  return stage_put(batch, key::make_workspace_key(workspace.id), value);
}

status storage<rocksdb_storage_tag>::stage_document(
    write_batch<rocksdb_storage_tag>& batch,
    const document_t& document) const {
  auto value = bytes_t{};
  auto encoded = encode_row(document, value);
  if (!encoded) {
    return encoded;
  }
  return stage_put(batch,
                   key::make_document_key(document.workspace_id, document.id),
                   value);
}

status storage<rocksdb_storage_tag>::stage_note(
    write_batch<rocksdb_storage_tag>& batch,
    const note_t& note) const {
  auto value = bytes_t{};
  auto encoded = encode_row(note, value);
  if (!encoded) {
    return encoded;
  }
  return stage_put(batch, key::make_note_key(note.workspace_id, note.id),
                   value);
}

status storage<rocksdb_storage_tag>::commit(
    write_batch<rocksdb_storage_tag>& batch) const {
  if (!database) {
    return not_open();
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto result = database->Write(write_options, &batch.batch);
  if (!result.ok()) {
    spdlog::error("Failed to commit write batch of {} operation(s): {}",
                  batch.operations, result.ToString());
    return make_error(error_code::store_failure,
                      "failed to commit store transaction", result.ToString());
  }
  batch.batch.Clear();
  batch.operations = 0;
  return make_ok();
}

status storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix,
    std::vector<key_value_entry_t>& out) const {
  out.clear();
  if (!database) {
    return not_open();
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    out.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                    detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    out.clear();
    return make_error(error_code::store_failure, "failed to scan keyspace",
                      iterator->status().ToString());
  }
  return make_ok();
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  const auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      spdlog::warn("Unable to create {}: {}", parent.string(), ec.message());
    }
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    return store;
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace quire::storage
