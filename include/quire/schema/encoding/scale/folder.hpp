#pragma once
#include <quire/schema/folder.hpp>
#include <optional>
#include <string>
#include <tuple>

namespace quire::schema::encoding::scale {

// SCALE row layout of a folder. Field order is part of the on-disk format;
// append only.
using folder_row_t = std::tuple<uint16_t,
                                std::string,
                                std::string,
                                std::optional<std::string>,
                                uint64_t,
                                uint64_t>;

folder_row_t to_row(const folder<1>& o);
folder<1> from_row(folder_row_t&& row);

}  // namespace quire::schema::encoding::scale
