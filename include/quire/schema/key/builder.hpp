#pragma once
#include <quire/schema/primitives.hpp>
#include <string_view>

namespace quire::schema::key {

struct builder final {
  quire::schema::bytes_t data;

  builder& write(const std::string_view& str);

  /// Write an id followed by the `|` separator. Ids never contain `|`, so
  /// prefix scans over `PREFIX|id|` cannot match a longer sibling id.
  builder& component(const std::string_view& id);
};

}  // namespace quire::schema::key
