#include <quire/schema/encoding/scale/document.hpp>

#include <utility>

using namespace quire::schema;

namespace quire::schema::encoding::scale {

document_row_t to_row(const document<1>& o) {
  return document_row_t{o.version,
                        o.id,
                        o.file_name,
                        o.mime_type,
                        o.size_bytes,
                        o.status,
                        o.status_message,
                        o.text_content,
                        o.file_path,
                        o.is_vectorized,
                        o.created_at,
                        o.updated_at,
                        o.workspace_id};
}

document<1> from_row(document_row_t&& row) {
  auto o = document<1>{};
  o.version = std::get<0>(row);
  o.id = std::move(std::get<1>(row));
  o.file_name = std::move(std::get<2>(row));
  o.mime_type = std::move(std::get<3>(row));
  o.size_bytes = std::get<4>(row);
  o.status = std::move(std::get<5>(row));
  o.status_message = std::move(std::get<6>(row));
  o.text_content = std::move(std::get<7>(row));
  o.file_path = std::move(std::get<8>(row));
  o.is_vectorized = std::get<9>(row);
  o.created_at = std::get<10>(row);
  o.updated_at = std::get<11>(row);
  o.workspace_id = std::move(std::get<12>(row));
  return o;
}

}  // namespace quire::schema::encoding::scale
