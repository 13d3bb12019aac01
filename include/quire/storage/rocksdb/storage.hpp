#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <quire/schema/encoding/scale/encoder.hpp>
#include <quire/storage/storage.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace quire::storage {

namespace detail {

using encoder_t = quire::schema::encoding::encoder<
    quire::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const quire::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(const quire::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline quire::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct write_batch<rocksdb_storage_tag> final {
  ROCKSDB_NAMESPACE::WriteBatch batch;
  std::size_t operations{};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  bool is_open() const;

  quire::common::status load_folder(
      const std::string_view& folder_id,
      std::optional<quire::schema::folder_t>& out) const;
  quire::common::status list_folders(
      std::vector<quire::schema::folder_t>& out) const;
  quire::common::status load_workspace(
      const std::string_view& workspace_id,
      std::optional<quire::schema::workspace_t>& out) const;
  quire::common::status list_workspaces(
      std::vector<quire::schema::workspace_t>& out) const;
  quire::common::status list_documents(
      const std::string_view& workspace_id,
      std::vector<quire::schema::document_t>& out) const;
  quire::common::status list_notes(
      const std::string_view& workspace_id,
      std::vector<quire::schema::note_t>& out) const;

  quire::common::status save_folder(
      const quire::schema::folder_t& folder) const;

  quire::common::status stage_destroy_workspace(
      write_batch<rocksdb_storage_tag>& batch,
      const std::string_view& workspace_id,
      bool& existed) const;
  quire::common::status stage_workspace(
      write_batch<rocksdb_storage_tag>& batch,
      const quire::schema::workspace_t& workspace) const;
  quire::common::status stage_document(
      write_batch<rocksdb_storage_tag>& batch,
      const quire::schema::document_t& document) const;
  quire::common::status stage_note(write_batch<rocksdb_storage_tag>& batch,
                                   const quire::schema::note_t& note) const;

  quire::common::status commit(write_batch<rocksdb_storage_tag>& batch) const;

  quire::common::status list_by_prefix(
      const quire::schema::bytes_view_t& prefix,
      std::vector<key_value_entry_t>& out) const;

 private:
  quire::common::status get_raw(const quire::schema::bytes_t& key,
                                std::optional<std::string>& out) const;
  quire::common::status stage_put(write_batch<rocksdb_storage_tag>& batch,
                                  const quire::schema::bytes_t& key,
                                  const quire::schema::bytes_t& value) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace quire::storage
