#include <spdlog/spdlog.h>
#include <quire/archive/archive_stream.hpp>
#include <quire/archive/layout.hpp>

#include <array>
#include <system_error>
#include <utility>

using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::archive {

archive_stream::archive_stream(temp_workspace workspace,
                               std::filesystem::path archive_path,
                               std::string file_name)
    : workspace_{std::move(workspace)},
      archive_path_{std::move(archive_path)},
      file_name_{std::move(file_name)},
      input_{std::make_unique<std::ifstream>(archive_path_, std::ios::binary)} {
  auto ec = std::error_code{};
  size_ = std::filesystem::file_size(archive_path_, ec);
  if (ec) {
    spdlog::warn("Failed to stat archive '{}': {}", archive_path_.string(),
                 ec.message());
    size_ = 0;
  }
  if (!*input_) {
    spdlog::error("Failed to open archive '{}' for reading",
                  archive_path_.string());
    close();
  }
}

archive_stream::~archive_stream() {
  close();
}

const std::string& archive_stream::file_name() const {
  return file_name_;
}

std::string_view archive_stream::content_type() const {
  return layout::kArchiveContentType;
}

uint64_t archive_stream::size() const {
  return size_;
}

std::size_t archive_stream::read(std::span<char> buffer) {
  if (closed() || buffer.empty()) {
    return 0;
  }
  input_->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  const auto count = static_cast<std::size_t>(input_->gcount());
  if (count == 0) {
    close();
  }
  return count;
}

status archive_stream::copy_to(std::ostream& out) {
  if (closed()) {
    return make_error(error_code::io_failure, "archive stream is closed",
                      file_name_);
  }
  auto buffer = std::array<char, 64 * 1024>{};
  for (auto count = read(buffer); count > 0; count = read(buffer)) {
    out.write(buffer.data(), static_cast<std::streamsize>(count));
    if (!out) {
      close();
      return make_error(error_code::io_failure,
                        "failed to write archive to output", file_name_);
    }
  }
  return make_ok();
}

bool archive_stream::closed() const {
  return input_ == nullptr;
}

void archive_stream::close() noexcept {
  input_.reset();
  workspace_.release();
}

}  // namespace quire::archive
