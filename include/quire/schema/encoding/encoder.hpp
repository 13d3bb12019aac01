#pragma once
#include <quire/schema/primitives.hpp>
#include <optional>
#include <span>

namespace quire::schema::encoding {

// Build time selection of the row codec used by the storage backends. The
// library is picked through a tag type, the same way storage backends are.
template <typename Library>
struct encoder {
  template <typename T>
  std::optional<quire::schema::bytes_t> encode(const T& obj);

  template <typename T>
  bool encode(const T& obj, quire::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const quire::schema::bytes_view_t& bytes);
};

}  // namespace quire::schema::encoding
