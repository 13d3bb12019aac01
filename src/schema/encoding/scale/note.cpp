#include <quire/schema/encoding/scale/note.hpp>

#include <utility>

using namespace quire::schema;

namespace quire::schema::encoding::scale {

note_row_t to_row(const note<1>& o) {
  return note_row_t{o.version,    o.id,         o.title,       o.content,
                    o.created_at, o.updated_at, o.workspace_id};
}

note<1> from_row(note_row_t&& row) {
  auto o = note<1>{};
  o.version = std::get<0>(row);
  o.id = std::move(std::get<1>(row));
  o.title = std::move(std::get<2>(row));
  o.content = std::move(std::get<3>(row));
  o.created_at = std::get<4>(row);
  o.updated_at = std::get<5>(row);
  o.workspace_id = std::move(std::get<6>(row));
  return o;
}

}  // namespace quire::schema::encoding::scale
