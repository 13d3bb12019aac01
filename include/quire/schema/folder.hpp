#pragma once
#include <quire/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: folder.
// Folders form a forest through `parent_id`; restore inserts them out of
// order, so relations are kept as ids and never as object references.
namespace quire::schema {

template <uint16_t Version>
struct folder;

template <>
struct folder<1> final {
  uint16_t version{1};
  id_t id;
  std::string name;
  std::optional<id_t> parent_id;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};

  bool operator==(const folder<1>&) const = default;
};

using folder_t = folder<1>;

}  // namespace quire::schema
