#include <spdlog/spdlog.h>
#include <quire/archive/zip.hpp>

#include <algorithm>
#include <string>
#include <system_error>
#include <vector>

using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::archive {

namespace {

std::string last_error(mz_zip_archive* zip) {
  return mz_zip_get_error_string(mz_zip_get_last_error(zip));
}

}  // namespace

bool is_safe_entry_name(const std::string_view name) {
  if (name.empty() || name.front() == '/' || name.front() == '\\') {
    return false;
  }
  if (name.find('\\') != std::string_view::npos ||
      name.find('\0') != std::string_view::npos) {
    return false;
  }
  // Drive letters (`C:`) are absolute on some platforms.
  if (name.size() >= 2 && name[1] == ':') {
    return false;
  }
  auto start = std::size_t{};
  while (start <= name.size()) {
    auto end = name.find('/', start);
    if (end == std::string_view::npos) {
      end = name.size();
    }
    if (name.substr(start, end - start) == "..") {
      return false;
    }
    start = end + 1;
  }
  return true;
}

zip_writer::zip_writer(const unsigned compression_level)
    : zip_{std::make_unique<mz_zip_archive>()},
      compression_level_{std::min(compression_level, 10u)} {
  mz_zip_zero_struct(zip_.get());
}

zip_writer::~zip_writer() {
  if (open_) {
    mz_zip_writer_end(zip_.get());
  }
}

status zip_writer::failure(const std::string_view what) const {
  auto reason = last_error(zip_.get());
  spdlog::error("Zip write failed: {}: {}", what, reason);
  return make_error(error_code::archive_write_failed, std::string{what},
                    reason);
}

status zip_writer::open(const std::filesystem::path& path) {
  if (!mz_zip_writer_init_file(zip_.get(), path.string().c_str(), 0)) {
    return failure("failed to create archive " + path.string());
  }
  open_ = true;
  return make_ok();
}

status zip_writer::add_directory(const std::string_view name) {
  auto entry = std::string{name};
  if (entry.empty() || entry.back() != '/') {
    entry.push_back('/');
  }
  if (!mz_zip_writer_add_mem(zip_.get(), entry.c_str(), nullptr, 0, 0)) {
    return failure("failed to add directory entry " + entry);
  }
  return make_ok();
}

status zip_writer::add_file(const std::string_view name,
                            const std::filesystem::path& source) {
  auto entry = std::string{name};
  if (!mz_zip_writer_add_file(zip_.get(), entry.c_str(),
                              source.string().c_str(), nullptr, 0,
                              compression_level_)) {
    return failure("failed to add file " + entry);
  }
  return make_ok();
}

status zip_writer::add_tree(const std::filesystem::path& root) {
  auto entries = std::vector<std::filesystem::path>{};
  auto ec = std::error_code{};
  for (auto it = std::filesystem::recursive_directory_iterator{root, ec};
       !ec && it != std::filesystem::recursive_directory_iterator{};
       it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) {
    spdlog::error("Failed to walk '{}': {}", root.string(), ec.message());
    return make_error(error_code::io_failure, "failed to walk archive tree",
                      root.string() + ": " + ec.message());
  }
  std::sort(std::begin(entries), std::end(entries));

  for (const auto& entry : entries) {
    const auto name = entry.lexically_relative(root).generic_string();
    if (std::filesystem::is_directory(entry, ec)) {
      auto added = add_directory(name);
      if (!added) {
        return added;
      }
      continue;
    }
    auto added = add_file(name, entry);
    if (!added) {
      return added;
    }
  }
  return make_ok();
}

status zip_writer::finalize() {
  if (!open_) {
    return make_error(error_code::archive_write_failed, "archive not open");
  }
  auto finalized = mz_zip_writer_finalize_archive(zip_.get());
  auto result =
      finalized ? make_ok() : failure("failed to write central directory");
  if (!mz_zip_writer_end(zip_.get()) && result) {
    result = failure("failed to close archive");
  }
  open_ = false;
  return result;
}

zip_reader::zip_reader() : zip_{std::make_unique<mz_zip_archive>()} {
  mz_zip_zero_struct(zip_.get());
}

zip_reader::~zip_reader() {
  if (open_) {
    mz_zip_reader_end(zip_.get());
  }
}

status zip_reader::failure(const std::string_view what) const {
  auto reason = last_error(zip_.get());
  spdlog::warn("Zip read failed: {}: {}", what, reason);
  return make_error(error_code::invalid_archive, std::string{what}, reason);
}

status zip_reader::open(const std::filesystem::path& path) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_regular_file(path, ec)) {
    return make_error(error_code::invalid_archive, "archive file not found",
                      path.string());
  }
  if (!mz_zip_reader_init_file(zip_.get(), path.string().c_str(), 0)) {
    return failure("not a readable zip archive");
  }
  open_ = true;
  return make_ok();
}

status zip_reader::extract_all(const std::filesystem::path& destination,
                               const uint64_t max_total_bytes) {
  if (!open_) {
    return make_error(error_code::invalid_archive, "archive not open");
  }
  const auto count = mz_zip_reader_get_num_files(zip_.get());

  // Vet every entry before writing anything.
  auto total = uint64_t{};
  for (auto i = mz_uint{}; i < count; ++i) {
    auto stat = mz_zip_archive_file_stat{};
    if (!mz_zip_reader_file_stat(zip_.get(), i, &stat)) {
      return failure("failed to read entry header");
    }
    if (!is_safe_entry_name(stat.m_filename)) {
      spdlog::warn("Rejecting archive entry with unsafe path '{}'",
                   stat.m_filename);
      return make_error(error_code::invalid_archive,
                        "archive entry escapes extraction root",
                        stat.m_filename);
    }
    if (!mz_zip_reader_is_file_supported(zip_.get(), i)) {
      return make_error(error_code::invalid_archive,
                        "unsupported archive entry", stat.m_filename);
    }
    total += stat.m_uncomp_size;
    if (total > max_total_bytes) {
      spdlog::warn("Archive expands beyond the {} byte limit",
                   max_total_bytes);
      return make_error(error_code::invalid_archive,
                        "archive exceeds the extraction size limit",
                        std::to_string(max_total_bytes));
    }
  }

  for (auto i = mz_uint{}; i < count; ++i) {
    auto stat = mz_zip_archive_file_stat{};
    if (!mz_zip_reader_file_stat(zip_.get(), i, &stat)) {
      return failure("failed to read entry header");
    }
    const auto target = destination / std::filesystem::path{stat.m_filename};
    auto ec = std::error_code{};
    if (mz_zip_reader_is_file_a_directory(zip_.get(), i)) {
      std::filesystem::create_directories(target, ec);
    } else {
      std::filesystem::create_directories(target.parent_path(), ec);
    }
    if (ec) {
      return make_error(error_code::io_failure,
                        "failed to create extraction directory",
                        target.string() + ": " + ec.message());
    }
    if (mz_zip_reader_is_file_a_directory(zip_.get(), i)) {
      continue;
    }
    if (!mz_zip_reader_extract_to_file(zip_.get(), i, target.string().c_str(),
                                       0)) {
      return failure(std::string{"failed to extract "} + stat.m_filename);
    }
  }
  spdlog::debug("Extracted {} entries ({} bytes) into '{}'", count, total,
                destination.string());
  return make_ok();
}

}  // namespace quire::archive
