#pragma once
#include <quire/common/status.hpp>
#include <json/json.h>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace quire::schema::encoding::json {

/// Serialize with two-space indentation, the layout archives have always
/// used.
std::string to_string(const Json::Value& value);

std::optional<Json::Value> parse(const std::string_view text,
                                 std::string& error);

quire::common::status write_file(const std::filesystem::path& path,
                                 const Json::Value& value);

quire::common::status write_text_file(const std::filesystem::path& path,
                                      const std::string_view text);

/// Read and parse a JSON document. On failure returns std::nullopt and
/// `error` holds a human readable reason.
std::optional<Json::Value> read_file(const std::filesystem::path& path,
                                     std::string& error);

std::optional<std::string> read_text_file(const std::filesystem::path& path,
                                          std::string& error);

}  // namespace quire::schema::encoding::json
