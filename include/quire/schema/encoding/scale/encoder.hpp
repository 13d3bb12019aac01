#pragma once
#include <quire/schema/encoding/encoder.hpp>
#include <quire/schema/encoding/scale/document.hpp>
#include <quire/schema/encoding/scale/folder.hpp>
#include <quire/schema/encoding/scale/note.hpp>
#include <quire/schema/encoding/scale/workspace.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace quire::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  std::optional<quire::schema::bytes_t> encode(const T& obj);

  template <typename T>
  bool encode(const T& obj, quire::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const quire::schema::bytes_view_t& bytes);
};

template <typename T>
std::optional<quire::schema::bytes_t> encoder<scale_encoder_tag>::encode(
    const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    return std::nullopt;
  }
  return encoded.value();
}

template <typename T>
bool encoder<scale_encoder_tag>::encode(const T& obj,
                                        quire::schema::bytes_t& out) {
  auto encoded = encode(obj);
  if (!encoded) {
    return false;
  }
  out.insert(std::end(out), std::begin(*encoded), std::end(*encoded));
  return true;
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const quire::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace quire::schema::encoding
