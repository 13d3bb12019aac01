#include <quire/schema/encoding/scale/workspace.hpp>

#include <utility>

using namespace quire::schema;

namespace quire::schema::encoding::scale {

workspace_row_t to_row(const workspace<1>& o) {
  return workspace_row_t{o.version,    o.id,         o.title,
                         o.folder_id,  o.created_at, o.updated_at,
                         o.notes,      o.extra_json};
}

workspace<1> from_row(workspace_row_t&& row) {
  auto o = workspace<1>{};
  o.version = std::get<0>(row);
  o.id = std::move(std::get<1>(row));
  o.title = std::move(std::get<2>(row));
  o.folder_id = std::move(std::get<3>(row));
  o.created_at = std::get<4>(row);
  o.updated_at = std::get<5>(row);
  o.notes = std::move(std::get<6>(row));
  o.extra_json = std::move(std::get<7>(row));
  return o;
}

}  // namespace quire::schema::encoding::scale
