#pragma once
#include <quire/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: document.
// One uploaded file per row; the bytes live under the owning workspace's
// `documents` blob tree.
namespace quire::schema {

template <uint16_t Version>
struct document;

template <>
struct document<1> final {
  uint16_t version{1};
  id_t id;
  std::string file_name;
  std::optional<std::string> mime_type;
  uint64_t size_bytes{};
  std::string status;
  std::optional<std::string> status_message;
  std::optional<std::string> text_content;
  std::optional<std::string> file_path;
  bool is_vectorized{false};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  id_t workspace_id;

  bool operator==(const document<1>&) const = default;
};

using document_t = document<1>;

}  // namespace quire::schema
