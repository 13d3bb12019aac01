#pragma once
#include <quire/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: note.
// Structured notepad rows. Markdown files under the workspace's `notes` blob
// tree are named after `id`, which is why restore never re-keys notes.
namespace quire::schema {

template <uint16_t Version>
struct note;

template <>
struct note<1> final {
  uint16_t version{1};
  id_t id;
  std::optional<std::string> title;
  std::optional<std::string> content;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  id_t workspace_id;

  bool operator==(const note<1>&) const = default;
};

using note_t = note<1>;

}  // namespace quire::schema
