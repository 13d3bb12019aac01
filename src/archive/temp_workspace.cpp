#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <quire/archive/temp_workspace.hpp>
#include <quire/schema/primitives.hpp>

#include <array>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <utility>

using quire::common::error_code;
using quire::common::make_error;
using quire::common::make_ok;
using quire::common::status;

namespace quire::archive {

namespace {

constexpr auto kMaxAcquireAttempts = 8;
constexpr auto kSuffixBytes = std::size_t{8};

struct temp_registry final {
  std::mutex mutex;
  std::set<std::filesystem::path> paths;
};

temp_registry& registry() {
  static auto instance = temp_registry{};
  return instance;
}

void track(const std::filesystem::path& path) {
  auto& r = registry();
  auto lock = std::scoped_lock{r.mutex};
  r.paths.insert(path);
}

void untrack(const std::filesystem::path& path) {
  auto& r = registry();
  auto lock = std::scoped_lock{r.mutex};
  r.paths.erase(path);
}

std::optional<std::string> random_suffix() {
  auto bytes = std::array<uint8_t, kSuffixBytes>{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return std::nullopt;
  }
  return quire::schema::to_hex(bytes);
}

void remove_tree(const std::filesystem::path& path) noexcept {
  auto ec = std::error_code{};
  std::filesystem::remove_all(path, ec);
  if (ec) {
    spdlog::error("Failed to remove temporary directory '{}': {}",
                  path.string(), ec.message());
  }
}

}  // namespace

std::optional<temp_workspace> temp_workspace::acquire(
    const std::filesystem::path& root,
    const std::string_view prefix,
    status& result) {
  auto ec = std::error_code{};
  std::filesystem::create_directories(root, ec);
  if (ec) {
    result = make_error(error_code::io_failure,
                        "failed to create temporary root",
                        root.string() + ": " + ec.message());
    return std::nullopt;
  }

  for (auto attempt = 0; attempt < kMaxAcquireAttempts; ++attempt) {
    auto suffix = random_suffix();
    if (!suffix) {
      result = make_error(error_code::io_failure,
                          "failed to generate temporary directory name");
      return std::nullopt;
    }
    auto candidate = root / (std::string{prefix} + "-" + *suffix);
    // create_directory reports false without an error when the path exists.
    if (std::filesystem::create_directory(candidate, ec)) {
      spdlog::debug("Acquired temporary directory '{}'", candidate.string());
      result = make_ok();
      return temp_workspace{std::move(candidate)};
    }
    if (ec) {
      result = make_error(error_code::io_failure,
                          "failed to create temporary directory",
                          candidate.string() + ": " + ec.message());
      return std::nullopt;
    }
  }
  result = make_error(error_code::io_failure,
                      "exhausted attempts to create a unique temporary "
                      "directory",
                      root.string());
  return std::nullopt;
}

temp_workspace::temp_workspace(std::filesystem::path path)
    : path_{std::move(path)} {
  track(path_);
}

temp_workspace::temp_workspace(temp_workspace&& other) noexcept
    : path_{std::move(other.path_)}, released_{other.released_} {
  other.released_ = true;
}

temp_workspace& temp_workspace::operator=(temp_workspace&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    released_ = other.released_;
    other.released_ = true;
  }
  return *this;
}

temp_workspace::~temp_workspace() {
  release();
}

const std::filesystem::path& temp_workspace::path() const {
  return path_;
}

bool temp_workspace::released() const {
  return released_;
}

void temp_workspace::release() noexcept {
  if (released_) {
    return;
  }
  released_ = true;
  remove_tree(path_);
  untrack(path_);
  spdlog::debug("Released temporary directory '{}'", path_.string());
}

status temp_workspace::persist(const std::filesystem::path& target) {
  if (released_) {
    return make_error(error_code::io_failure,
                      "temporary directory already released", path_.string());
  }
  auto ec = std::error_code{};
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return make_error(error_code::io_failure,
                        "failed to create destination parent",
                        target.string() + ": " + ec.message());
    }
  }
  std::filesystem::rename(path_, target, ec);
  if (ec) {
    return make_error(error_code::io_failure,
                      "failed to move temporary directory into place",
                      path_.string() + " -> " + target.string() + ": " +
                          ec.message());
  }
  untrack(path_);
  released_ = true;
  return make_ok();
}

std::size_t release_all_temp_directories() noexcept {
  auto& r = registry();
  auto lock = std::scoped_lock{r.mutex};
  auto released = r.paths.size();
  for (const auto& path : r.paths) {
    remove_tree(path);
  }
  r.paths.clear();
  return released;
}

std::size_t live_temp_directory_count() {
  auto& r = registry();
  auto lock = std::scoped_lock{r.mutex};
  return r.paths.size();
}

}  // namespace quire::archive
