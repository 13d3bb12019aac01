#include <quire/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <string_view>

namespace quire::schema {

namespace {

constexpr auto kMillisecondsPerSecond = int64_t{1000};
constexpr auto kSecondsPerDay = int64_t{86400};

// Proleptic Gregorian conversions (Howard Hinnant's civil calendar
// algorithms) so that no libc timezone state is involved.
int64_t days_from_civil(int64_t year, const unsigned month, const unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const auto era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const auto doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const auto doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct civil_date final {
  int64_t year{};
  unsigned month{};
  unsigned day{};
};

civil_date civil_from_days(int64_t days) {
  days += 719468;
  const auto era = (days >= 0 ? days : days - 146096) / 146097;
  const auto doe = static_cast<unsigned>(days - era * 146097);
  const auto yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const auto mp = (5 * doy + 2) / 153;
  const auto day = doy - (153 * mp + 2) / 5 + 1;
  const auto month = mp < 10 ? mp + 3 : mp - 9;
  const auto year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
  return civil_date{.year = year, .month = month, .day = day};
}

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

std::optional<unsigned> read_digits(const std::string_view value,
                                    const std::size_t offset,
                                    const std::size_t count) {
  if (offset + count > value.size()) {
    return std::nullopt;
  }
  auto result = 0u;
  for (auto i = offset; i < offset + count; ++i) {
    if (!is_digit(value[i])) {
      return std::nullopt;
    }
    result = result * 10 + static_cast<unsigned>(value[i] - '0');
  }
  return result;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return make_bytes(std::string_view{bytes});
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                 reinterpret_cast<const uint8_t*>(bytes.data()) + bytes.size()};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return make_bytes_view(std::string_view{bytes});
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kDigits[(byte >> 4u) & 0x0F]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

bool is_valid_id(const std::string_view id) {
  // A leading '.' also covers "." and "..".
  if (id.empty() || id.front() == '.') {
    return false;
  }
  return std::ranges::none_of(id, [](const char c) {
    return c == '/' || c == '\\' || c == '|' || c == '\0';
  });
}

std::string format_iso8601(const timestamp_milliseconds_t value) {
  const auto total_ms = static_cast<int64_t>(value);
  const auto total_seconds = total_ms / kMillisecondsPerSecond;
  const auto millis = total_ms % kMillisecondsPerSecond;
  const auto days = total_seconds / kSecondsPerDay;
  const auto seconds_of_day = total_seconds % kSecondsPerDay;
  const auto date = civil_from_days(days);

  auto buffer = std::array<char, 32>{};
  std::snprintf(buffer.data(), buffer.size(),
                "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(seconds_of_day / 3600),
                static_cast<long long>((seconds_of_day % 3600) / 60),
                static_cast<long long>(seconds_of_day % 60),
                static_cast<long long>(millis));
  return std::string{buffer.data()};
}

std::optional<timestamp_milliseconds_t> parse_iso8601(
    const std::string_view value) {
  // YYYY-MM-DDTHH:MM:SS is the minimum accepted shape.
  if (value.size() < 19 || value[4] != '-' || value[7] != '-' ||
      (value[10] != 'T' && value[10] != 't' && value[10] != ' ') ||
      value[13] != ':' || value[16] != ':') {
    return std::nullopt;
  }
  const auto year = read_digits(value, 0, 4);
  const auto month = read_digits(value, 5, 2);
  const auto day = read_digits(value, 8, 2);
  const auto hour = read_digits(value, 11, 2);
  const auto minute = read_digits(value, 14, 2);
  const auto second = read_digits(value, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }
  if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 ||
      *minute > 59 || *second > 60) {
    return std::nullopt;
  }

  auto offset = std::size_t{19};
  auto millis = int64_t{};
  if (offset < value.size() && value[offset] == '.') {
    ++offset;
    auto digits = 0;
    while (offset < value.size() && is_digit(value[offset])) {
      // Only millisecond precision is kept.
      if (digits < 3) {
        millis = millis * 10 + (value[offset] - '0');
      }
      ++digits;
      ++offset;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  auto offset_seconds = int64_t{};
  if (offset == value.size()) {
    // No designator: treated as UTC.
  } else if (value[offset] == 'Z' || value[offset] == 'z') {
    ++offset;
  } else if (value[offset] == '+' || value[offset] == '-') {
    const auto sign = value[offset] == '-' ? -1 : 1;
    const auto offset_hours = read_digits(value, offset + 1, 2);
    const auto offset_minutes = read_digits(value, offset + 4, 2);
    if (!offset_hours || !offset_minutes || value[offset + 3] != ':') {
      return std::nullopt;
    }
    offset_seconds = sign * (static_cast<int64_t>(*offset_hours) * 3600 +
                             static_cast<int64_t>(*offset_minutes) * 60);
    offset += 6;
  } else {
    return std::nullopt;
  }
  if (offset != value.size()) {
    return std::nullopt;
  }

  const auto days = days_from_civil(static_cast<int64_t>(*year), *month, *day);
  const auto seconds = days * kSecondsPerDay +
                       static_cast<int64_t>(*hour) * 3600 +
                       static_cast<int64_t>(*minute) * 60 +
                       static_cast<int64_t>(*second) - offset_seconds;
  if (seconds < 0) {
    return std::nullopt;
  }
  const auto total = static_cast<timestamp_milliseconds_t>(
      seconds * kMillisecondsPerSecond + millis);
  if (total > kMaxTimestampMilliseconds) {
    return std::nullopt;
  }
  return total;
}

timestamp_milliseconds_t now_milliseconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace quire::schema
