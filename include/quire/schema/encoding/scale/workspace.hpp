#pragma once
#include <quire/schema/workspace.hpp>
#include <optional>
#include <string>
#include <tuple>

namespace quire::schema::encoding::scale {

using workspace_row_t = std::tuple<uint16_t,
                                   std::string,
                                   std::string,
                                   std::optional<std::string>,
                                   uint64_t,
                                   uint64_t,
                                   std::optional<std::string>,
                                   std::string>;

workspace_row_t to_row(const workspace<1>& o);
workspace<1> from_row(workspace_row_t&& row);

}  // namespace quire::schema::encoding::scale
