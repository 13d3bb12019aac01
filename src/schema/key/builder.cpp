#include <algorithm>
#include <iterator>
#include <quire/schema/key/builder.hpp>
#include <ranges>

using namespace quire::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), static_cast<std::ptrdiff_t>(str.size()),
                      std::back_inserter(data));
  return *this;
}

builder& builder::component(const std::string_view& id) {
  write(id);
  data.push_back(static_cast<uint8_t>('|'));
  return *this;
}
