#include <quire/schema/encoding/scale/folder.hpp>

#include <utility>

using namespace quire::schema;

namespace quire::schema::encoding::scale {

folder_row_t to_row(const folder<1>& o) {
  return folder_row_t{o.version,    o.id,         o.name,
                      o.parent_id,  o.created_at, o.updated_at};
}

folder<1> from_row(folder_row_t&& row) {
  auto o = folder<1>{};
  o.version = std::get<0>(row);
  o.id = std::move(std::get<1>(row));
  o.name = std::move(std::get<2>(row));
  o.parent_id = std::move(std::get<3>(row));
  o.created_at = std::get<4>(row);
  o.updated_at = std::get<5>(row);
  return o;
}

}  // namespace quire::schema::encoding::scale
