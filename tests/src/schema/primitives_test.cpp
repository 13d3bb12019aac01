#include <gtest/gtest.h>
#include <quire/schema/primitives.hpp>

TEST(primitives, make_bytes_and_string_round_trip) {
  auto bytes = quire::schema::make_bytes(std::string_view{"STATE|"});
  EXPECT_EQ(bytes.size(), 6u);
  EXPECT_EQ(quire::schema::make_string(bytes), "STATE|");
}

TEST(primitives, to_hex_renders_lowercase_pairs) {
  auto bytes = quire::schema::bytes_t{0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ(quire::schema::to_hex(bytes), "000fabff");
}

TEST(primitives, is_valid_id_rejects_path_and_key_separators) {
  EXPECT_TRUE(quire::schema::is_valid_id("clx9f2k0a0000"));
  EXPECT_TRUE(quire::schema::is_valid_id("3f0c5a8e-7d4e-4c5f-9a3b-1c2d3e4f5a6b"));
  EXPECT_FALSE(quire::schema::is_valid_id(""));
  EXPECT_FALSE(quire::schema::is_valid_id("."));
  EXPECT_FALSE(quire::schema::is_valid_id(".."));
  EXPECT_FALSE(quire::schema::is_valid_id(".quire"));
  EXPECT_FALSE(quire::schema::is_valid_id(".x.retired"));
  EXPECT_TRUE(quire::schema::is_valid_id("a.b"));
  EXPECT_FALSE(quire::schema::is_valid_id("a/b"));
  EXPECT_FALSE(quire::schema::is_valid_id("a\\b"));
  EXPECT_FALSE(quire::schema::is_valid_id("a|b"));
  EXPECT_FALSE(quire::schema::is_valid_id(std::string_view{"a\0b", 3}));
}

TEST(primitives, format_iso8601_renders_milliseconds_utc) {
  EXPECT_EQ(quire::schema::format_iso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(quire::schema::format_iso8601(1747894682000),
            "2025-05-22T06:18:02.000Z");
  EXPECT_EQ(quire::schema::format_iso8601(951782400123),
            "2000-02-29T00:00:00.123Z");
}

TEST(primitives, parse_iso8601_accepts_common_shapes) {
  EXPECT_EQ(quire::schema::parse_iso8601("2025-05-22T06:18:02.000Z"),
            std::optional<uint64_t>{1747894682000});
  EXPECT_EQ(quire::schema::parse_iso8601("2025-05-22T06:18:02Z"),
            std::optional<uint64_t>{1747894682000});
  EXPECT_EQ(quire::schema::parse_iso8601("2025-05-22T06:18:02"),
            std::optional<uint64_t>{1747894682000});
  EXPECT_EQ(quire::schema::parse_iso8601("2025-05-22T08:18:02.5+02:00"),
            std::optional<uint64_t>{1747894682500});
  EXPECT_EQ(quire::schema::parse_iso8601("2025-05-22T06:18:02.123456Z"),
            std::optional<uint64_t>{1747894682123});
}

TEST(primitives, parse_iso8601_rejects_malformed_input) {
  EXPECT_FALSE(quire::schema::parse_iso8601("").has_value());
  EXPECT_FALSE(quire::schema::parse_iso8601("2025-05-22").has_value());
  EXPECT_FALSE(quire::schema::parse_iso8601("2025-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(quire::schema::parse_iso8601("2025-05-22T06:18:02.Z").has_value());
  EXPECT_FALSE(quire::schema::parse_iso8601("2025-05-22T06:18:02Zjunk").has_value());
  EXPECT_FALSE(quire::schema::parse_iso8601("yesterday at noon").has_value());
  // Shifted past the last four digit year by its offset.
  EXPECT_FALSE(quire::schema::parse_iso8601("9999-12-31T23:59:59.999-01:00")
                   .has_value());
  EXPECT_EQ(quire::schema::parse_iso8601("9999-12-31T23:59:59.999Z"),
            quire::schema::kMaxTimestampMilliseconds);
}

TEST(primitives, iso8601_format_then_parse_is_identity) {
  for (const auto value :
       {uint64_t{0}, uint64_t{1747894682123}, uint64_t{4102444799999}}) {
    auto parsed =
        quire::schema::parse_iso8601(quire::schema::format_iso8601(value));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, value);
  }
}
