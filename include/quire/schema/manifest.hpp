#pragma once
#include <quire/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: manifest.
// Top level archive descriptor. The workspace id list is authoritative: the
// archive must contain exactly one directory per listed id.
namespace quire::schema {

inline constexpr auto kManifestFormatVersion = std::string_view{"1.0"};
inline constexpr auto kManifestSupportedMajor = uint32_t{1};

template <uint16_t Version>
struct manifest;

template <>
struct manifest<1> final {
  std::string format_version{kManifestFormatVersion};
  std::string created_at;
  std::vector<id_t> workspace_ids;
};

using manifest_t = manifest<1>;

}  // namespace quire::schema
