#pragma once
#include <quire/schema/note.hpp>
#include <optional>
#include <string>
#include <tuple>

namespace quire::schema::encoding::scale {

using note_row_t = std::tuple<uint16_t,
                              std::string,
                              std::optional<std::string>,
                              std::optional<std::string>,
                              uint64_t,
                              uint64_t,
                              std::string>;

note_row_t to_row(const note<1>& o);
note<1> from_row(note_row_t&& row);

}  // namespace quire::schema::encoding::scale
