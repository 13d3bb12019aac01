#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quire::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using timestamp_milliseconds_t = uint64_t;

/// Folders, workspaces, documents and notes are keyed by opaque string ids
/// chosen by the source store (cuid/uuid style).
using id_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

/// True when `id` can be used both as a directory name inside an archive and
/// as a store key component.
bool is_valid_id(const std::string_view id);

/// 9999-12-31T23:59:59.999Z, the last instant with a four digit year.
inline constexpr auto kMaxTimestampMilliseconds =
    timestamp_milliseconds_t{253402300799999};

/// Render milliseconds since epoch as `YYYY-MM-DDTHH:MM:SS.mmmZ`. Values past
/// `kMaxTimestampMilliseconds` cannot be parsed back.
std::string format_iso8601(const timestamp_milliseconds_t value);

/// Parse an ISO-8601 date-time. Accepts an optional fractional part and
/// either `Z` or a `+HH:MM` / `-HH:MM` offset. Instants before the epoch or
/// after `kMaxTimestampMilliseconds` are rejected.
std::optional<timestamp_milliseconds_t> parse_iso8601(
    const std::string_view value);

timestamp_milliseconds_t now_milliseconds();

}  // namespace quire::schema
