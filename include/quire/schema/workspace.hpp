#pragma once
#include <quire/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: workspace (the notebook).
// Owns documents, notes and a blob tree keyed by `id`; belongs to at most one
// folder.
namespace quire::schema {

template <uint16_t Version>
struct workspace;

template <>
struct workspace<1> final {
  uint16_t version{1};
  id_t id;
  std::string title;
  std::optional<id_t> folder_id;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<std::string> notes;
  // Scalar columns this build does not model, kept as a serialized JSON
  // object so that they survive a backup/restore cycle untouched.
  std::string extra_json{"{}"};

  bool operator==(const workspace<1>&) const = default;
};

using workspace_t = workspace<1>;

}  // namespace quire::schema
