#include <spdlog/spdlog.h>
#include <quire/archive/archive_builder.hpp>
#include <quire/archive/archive_extractor.hpp>
#include <quire/backup/service.hpp>

#include <system_error>
#include <utility>

using quire::common::status;

namespace quire::backup {

service::service(
    quire::storage::storage<quire::storage::rocksdb_storage_tag>& storage,
    quire::config::options options)
    : storage_{storage},
      options_{std::move(options)},
      blobs_{options_.blob_root} {}

std::optional<quire::archive::archive_stream> service::create_backup(
    const std::vector<quire::schema::backup_request_t>& requests,
    status& result) const {
  spdlog::info("Starting backup of {} workspace(s)", requests.size());
  auto builder = quire::archive::archive_builder{storage_, blobs_, options_};
  return builder.build(requests, result);
}

quire::restore::restore_result service::restore_from_backup(
    const std::filesystem::path& archive_path) {
  spdlog::info("Starting restore from '{}'", archive_path.string());
  auto result = quire::restore::restore_result{};
  {
    auto extractor = quire::archive::archive_extractor{options_};
    auto extracted = extractor.extract(archive_path, result.status);
    if (!extracted) {
      result.phase = quire::restore::restore_phase::failed;
      result.message = "Invalid backup file: " + result.status.log;
    } else {
      auto orchestrator = quire::restore::orchestrator{
          storage_, blobs_, locks_, options_.on_failure};
      result = orchestrator.restore(*extracted);
    }
  }
  if (options_.remove_archive_after_restore) {
    discard_upload(archive_path);
  }
  return result;
}

void service::discard_upload(const std::filesystem::path& archive_path) const {
  auto ec = std::error_code{};
  if (std::filesystem::remove(archive_path, ec)) {
    spdlog::debug("Removed uploaded archive '{}'", archive_path.string());
  } else if (ec) {
    spdlog::warn("Failed to remove uploaded archive '{}': {}",
                 archive_path.string(), ec.message());
  }
}

const quire::config::options& service::options() const {
  return options_;
}

const quire::storage::blob_store& service::blobs() const {
  return blobs_;
}

}  // namespace quire::backup
