#pragma once
#include <quire/schema/document.hpp>
#include <optional>
#include <string>
#include <tuple>

namespace quire::schema::encoding::scale {

using document_row_t = std::tuple<uint16_t,
                                  std::string,
                                  std::string,
                                  std::optional<std::string>,
                                  uint64_t,
                                  std::string,
                                  std::optional<std::string>,
                                  std::optional<std::string>,
                                  std::optional<std::string>,
                                  bool,
                                  uint64_t,
                                  uint64_t,
                                  std::string>;

document_row_t to_row(const document<1>& o);
document<1> from_row(document_row_t&& row);

}  // namespace quire::schema::encoding::scale
