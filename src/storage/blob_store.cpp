#include <spdlog/spdlog.h>
#include <quire/storage/blob_store.hpp>

#include <string>
#include <system_error>
#include <utility>

using quire::archive::temp_workspace;
using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::storage {

namespace {

status io_error(const std::string& what,
                const std::filesystem::path& path,
                const std::error_code& ec) {
  spdlog::error("{} '{}': {}", what, path.string(), ec.message());
  return make_error(error_code::io_failure, what,
                    path.string() + ": " + ec.message());
}

}  // namespace

status copy_tree(const std::filesystem::path& source,
                 const std::filesystem::path& destination) {
  auto ec = std::error_code{};
  std::filesystem::create_directories(destination, ec);
  if (ec) {
    return io_error("Failed to create directory", destination, ec);
  }
  std::filesystem::copy(source, destination,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::overwrite_existing,
                        ec);
  if (ec) {
    return io_error("Failed to copy tree", source, ec);
  }
  return make_ok();
}

blob_store::blob_store(std::filesystem::path root) : root_{std::move(root)} {}

const std::filesystem::path& blob_store::root() const {
  return root_;
}

std::filesystem::path blob_store::reserved_root() const {
  return root_ / std::string{kReservedDirectory};
}

std::filesystem::path blob_store::workspace_root(
    const std::string_view workspace_id) const {
  return root_ / std::string{workspace_id};
}

bool blob_store::has_workspace(const std::string_view workspace_id) const {
  auto ec = std::error_code{};
  return std::filesystem::is_directory(workspace_root(workspace_id), ec);
}

status blob_store::export_tree(const std::string_view workspace_id,
                               const std::filesystem::path& destination) const {
  const auto source_root = workspace_root(workspace_id);
  for (const auto& [name, kind] : kBlobKindMappings) {
    const auto source = source_root / std::string{name};
    auto ec = std::error_code{};
    if (!std::filesystem::is_directory(source, ec)) {
      spdlog::warn("Workspace '{}' has no {} directory, skipping",
                   workspace_id, name);
      continue;
    }
    auto copied = copy_tree(source, destination / std::string{name});
    if (!copied) {
      return copied;
    }
  }
  return make_ok();
}

std::optional<temp_workspace> blob_store::begin_staging(
    const std::string_view workspace_id,
    status& result) const {
  return temp_workspace::acquire(
      reserved_root(), std::string{workspace_id} + ".staging", result);
}

status blob_store::stage_tree(const std::filesystem::path& source,
                              const temp_workspace& staging) const {
  for (const auto& [name, kind] : kBlobKindMappings) {
    const auto from = source / std::string{name};
    auto ec = std::error_code{};
    if (!std::filesystem::is_directory(from, ec)) {
      spdlog::debug("No {} directory in '{}'", name, source.string());
      continue;
    }
    auto copied = copy_tree(from, staging.path() / std::string{name});
    if (!copied) {
      return copied;
    }
  }
  return make_ok();
}

status blob_store::stage_legacy_tree(
    const std::filesystem::path& source,
    const temp_workspace& staging) const {
  const auto documents = std::string{to_string(blob_kind::documents)};
  const auto uploads = source / documents;
  auto ec = std::error_code{};
  if (std::filesystem::is_directory(uploads, ec)) {
    auto it = std::filesystem::directory_iterator{uploads, ec};
    for (; !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec)) {
      const auto name = it->path().filename().string();
      const auto is_directory = it->is_directory(ec);
      if (ec) {
        return io_error("Failed to inspect legacy upload", it->path(), ec);
      }
      if (!is_directory) {
        const auto target = staging.path() / documents / name;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (!ec) {
          std::filesystem::copy_file(
              it->path(), target,
              std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
          return io_error("Failed to copy legacy upload", it->path(), ec);
        }
        continue;
      }
      const auto kind = quire::schema::from_string(name, kBlobKindMappings);
      const auto target = kind ? staging.path() / name
                               : staging.path() / documents / name;
      auto copied = copy_tree(it->path(), target);
      if (!copied) {
        return copied;
      }
    }
    if (ec) {
      return io_error("Failed to list legacy uploads", uploads, ec);
    }
  } else {
    spdlog::debug("No {} directory in '{}'", documents, source.string());
  }

  for (const auto kind : {blob_kind::notes, blob_kind::vectors}) {
    const auto name = std::string{to_string(kind)};
    if (!std::filesystem::is_directory(source / name, ec)) {
      continue;
    }
    auto copied = copy_tree(source / name, staging.path() / name);
    if (!copied) {
      return copied;
    }
  }
  return make_ok();
}

status blob_store::install(const std::string_view workspace_id,
                           temp_workspace& staging) const {
  const auto target = workspace_root(workspace_id);
  const auto retired =
      reserved_root() / (std::string{workspace_id} + ".retired");

  auto ec = std::error_code{};
  std::filesystem::remove_all(retired, ec);
  if (ec) {
    return io_error("Failed to clear retired blob tree", retired, ec);
  }

  const auto had_previous = std::filesystem::exists(target, ec);
  if (had_previous) {
    std::filesystem::rename(target, retired, ec);
    if (ec) {
      return io_error("Failed to retire blob tree", target, ec);
    }
  }

  auto persisted = staging.persist(target);
  if (!persisted) {
    spdlog::error("Failed to install blob tree for workspace '{}': {}",
                  workspace_id, persisted.info);
    if (had_previous) {
      std::filesystem::rename(retired, target, ec);
      if (ec) {
        spdlog::error("Failed to restore retired blob tree '{}': {}",
                      retired.string(), ec.message());
      }
    }
    return persisted;
  }

  if (had_previous) {
    std::filesystem::remove_all(retired, ec);
    if (ec) {
      spdlog::warn("Failed to remove retired blob tree '{}': {}",
                   retired.string(), ec.message());
    }
  }
  return make_ok();
}

status blob_store::remove_workspace(const std::string_view workspace_id) const {
  const auto target = workspace_root(workspace_id);
  auto ec = std::error_code{};
  const auto removed = std::filesystem::remove_all(target, ec);
  if (ec) {
    return io_error("Failed to remove blob tree", target, ec);
  }
  spdlog::debug("Removed {} blob entries for workspace '{}'", removed,
                workspace_id);
  return make_ok();
}

}  // namespace quire::storage
