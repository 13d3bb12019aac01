#pragma once

#include <quire/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace quire::common {

enum class error_code : uint32_t {
  ok = 0,
  invalid_archive = 1,
  manifest_missing = 2,
  manifest_invalid = 3,
  unsupported_format_version = 4,
  manifest_content_mismatch = 5,
  invalid_identifier = 6,
  workspace_missing = 7,
  metadata_missing = 8,
  workspace_id_mismatch = 9,
  metadata_invalid = 10,
  store_failure = 20,
  io_failure = 30,
  archive_write_failed = 31,
  invalid_configuration = 40,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"invalid_archive",
                                            error_code::invalid_archive},
    std::pair<std::string_view, error_code>{"manifest_missing",
                                            error_code::manifest_missing},
    std::pair<std::string_view, error_code>{"manifest_invalid",
                                            error_code::manifest_invalid},
    std::pair<std::string_view, error_code>{
        "unsupported_format_version", error_code::unsupported_format_version},
    std::pair<std::string_view, error_code>{
        "manifest_content_mismatch", error_code::manifest_content_mismatch},
    std::pair<std::string_view, error_code>{"invalid_identifier",
                                            error_code::invalid_identifier},
    std::pair<std::string_view, error_code>{"workspace_missing",
                                            error_code::workspace_missing},
    std::pair<std::string_view, error_code>{"metadata_missing",
                                            error_code::metadata_missing},
    std::pair<std::string_view, error_code>{"workspace_id_mismatch",
                                            error_code::workspace_id_mismatch},
    std::pair<std::string_view, error_code>{"metadata_invalid",
                                            error_code::metadata_invalid},
    std::pair<std::string_view, error_code>{"store_failure",
                                            error_code::store_failure},
    std::pair<std::string_view, error_code>{"io_failure",
                                            error_code::io_failure},
    std::pair<std::string_view, error_code>{"archive_write_failed",
                                            error_code::archive_write_failed},
    std::pair<std::string_view, error_code>{
        "invalid_configuration", error_code::invalid_configuration},
};

inline constexpr std::string_view to_string(const error_code value) {
  return quire::schema::to_string(value, kErrorCodeMappings)
      .value_or("unknown");
}

/// Validation errors reject an archive before the store is touched.
inline constexpr bool is_validation_error(const error_code code) {
  return code != error_code::ok && code < error_code::store_failure;
}

/// Outcome envelope returned by every backup/restore step.
///
/// `log` is a short reason suitable for an API response, `info` carries the
/// detail (paths, library messages).
struct status final {
  error_code code{error_code::ok};
  std::string log;
  std::string info;

  bool ok() const { return code == error_code::ok; }
  explicit operator bool() const { return ok(); }
};

inline status make_ok() {
  return status{};
}

inline status make_error(const error_code code,
                         std::string log,
                         std::string info = {}) {
  return status{.code = code, .log = std::move(log), .info = std::move(info)};
}

}  // namespace quire::common
