#include <quire/schema/encoding/json/file.hpp>

#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

namespace quire::schema::encoding::json {

std::string to_string(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

std::optional<Json::Value> parse(const std::string_view text,
                                 std::string& error) {
  auto builder = Json::CharReaderBuilder{};
  builder["collectComments"] = false;
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto value = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value,
                     &errors)) {
    error = errors.empty() ? std::string{"malformed JSON"} : errors;
    return std::nullopt;
  }
  return value;
}

quire::common::status write_file(const std::filesystem::path& path,
                                 const Json::Value& value) {
  return write_text_file(path, to_string(value));
}

quire::common::status write_text_file(const std::filesystem::path& path,
                                      const std::string_view text) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!out) {
    return quire::common::make_error(quire::common::error_code::io_failure,
                                     "failed to open file for writing",
                                     path.string());
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();
  if (!out) {
    return quire::common::make_error(quire::common::error_code::io_failure,
                                     "failed to write file", path.string());
  }
  return quire::common::make_ok();
}

std::optional<std::string> read_text_file(const std::filesystem::path& path,
                                          std::string& error) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    error = "failed to open " + path.string();
    return std::nullopt;
  }
  auto text = std::string{std::istreambuf_iterator<char>{in},
                          std::istreambuf_iterator<char>{}};
  if (in.bad()) {
    error = "failed to read " + path.string();
    return std::nullopt;
  }
  return text;
}

std::optional<Json::Value> read_file(const std::filesystem::path& path,
                                     std::string& error) {
  auto text = read_text_file(path, error);
  if (!text) {
    return std::nullopt;
  }
  auto parse_error = std::string{};
  auto value = parse(*text, parse_error);
  if (!value) {
    error = path.filename().string() + ": " + parse_error;
    spdlog::debug("Failed to parse JSON file '{}': {}", path.string(),
                  parse_error);
    return std::nullopt;
  }
  return value;
}

}  // namespace quire::schema::encoding::json
