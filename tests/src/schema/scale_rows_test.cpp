#include <quire/schema/encoding/scale/encoder.hpp>
#include <quire/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace {

using encoder_t = quire::schema::encoding::encoder<
    quire::schema::encoding::scale_encoder_tag>;
namespace rows = quire::schema::encoding::scale;

}  // namespace

TEST(scale_rows, rows_lead_with_their_schema_version) {
  auto encoder = encoder_t{};
  auto encoded =
      encoder.encode(rows::to_row(quire::testing::make_folder("f-1")));
  ASSERT_TRUE(encoded.has_value());
  ASSERT_GE(encoded->size(), 2u);
  // uint16 little endian
  EXPECT_EQ((*encoded)[0], 1u);
  EXPECT_EQ((*encoded)[1], 0u);
}

TEST(scale_rows, note_without_title_survives_encoding) {
  auto note = quire::testing::make_note("ws-1", "n-1");
  note.title.reset();
  note.content = std::string(1024, 'x');

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(rows::to_row(note));
  ASSERT_TRUE(encoded.has_value());
  auto decoded = encoder.try_decode<rows::note_row_t>(
      quire::schema::make_bytes_view(*encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(rows::from_row(std::move(*decoded)), note);
}

TEST(scale_rows, truncated_rows_fail_to_decode) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(
      rows::to_row(quire::testing::make_document("ws-1", "d-1")));
  ASSERT_TRUE(encoded.has_value());
  encoded->resize(encoded->size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<rows::document_row_t>(
                       quire::schema::make_bytes_view(*encoded))
                   .has_value());
}
