#include <quire/archive/zip.hpp>
#include <quire/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace {

class zip_fixture final {
 public:
  explicit zip_fixture(const std::string_view prefix)
      : base_{quire::testing::make_db_path(prefix)} {
    std::filesystem::create_directories(base_);
  }
  ~zip_fixture() { quire::testing::remove_path(base_); }

  const std::filesystem::path& base() const { return base_; }

  /// Write an archive whose entries are named exactly as given.
  std::filesystem::path make_raw_archive(
      const std::vector<std::pair<std::string, std::string>>& entries) {
    const auto archive = base_ / "raw.zip";
    auto writer = quire::archive::zip_writer{6};
    EXPECT_TRUE(writer.open(archive));
    auto index = 0;
    for (const auto& [name, content] : entries) {
      const auto source = base_ / ("source-" + std::to_string(index++));
      quire::testing::write_text(source, content);
      EXPECT_TRUE(writer.add_file(name, source));
    }
    EXPECT_TRUE(writer.finalize());
    return archive;
  }

 private:
  std::filesystem::path base_;
};

}  // namespace

TEST(zip, safe_entry_names_stay_relative) {
  EXPECT_TRUE(quire::archive::is_safe_entry_name("manifest.json"));
  EXPECT_TRUE(quire::archive::is_safe_entry_name("ws-1/documents/a.pdf"));
  EXPECT_TRUE(quire::archive::is_safe_entry_name("ws-1/notes/"));
  EXPECT_TRUE(quire::archive::is_safe_entry_name("ws-1/..hidden"));

  EXPECT_FALSE(quire::archive::is_safe_entry_name(""));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("/etc/passwd"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("\\windows"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("C:/windows"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("ws-1\\documents"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name(".."));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("../escape.txt"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("ws-1/../../escape.txt"));
  EXPECT_FALSE(quire::archive::is_safe_entry_name("ws-1/.."));
}

TEST(zip, tree_round_trips_with_empty_directories) {
  auto fixture = zip_fixture{"quire_zip_tree"};
  const auto source = fixture.base() / "source";
  quire::testing::write_text(source / "manifest.json", "{}");
  quire::testing::write_text(source / "ws-1/documents/a.pdf", "%PDF");
  std::filesystem::create_directories(source / "ws-1/vectors");

  const auto archive = fixture.base() / "tree.zip";
  auto writer = quire::archive::zip_writer{9};
  ASSERT_TRUE(writer.open(archive));
  ASSERT_TRUE(writer.add_tree(source));
  ASSERT_TRUE(writer.finalize());

  const auto destination = fixture.base() / "out";
  auto reader = quire::archive::zip_reader{};
  ASSERT_TRUE(reader.open(archive));
  ASSERT_TRUE(reader.extract_all(destination, 1 << 20));
  EXPECT_EQ(quire::testing::snapshot_tree(destination),
            quire::testing::snapshot_tree(source));
}

TEST(zip, traversal_entries_are_rejected_before_writing) {
  auto fixture = zip_fixture{"quire_zip_traversal"};
  const auto archive = fixture.make_raw_archive({
      {"manifest.json", "{}"},
      {"../escape.txt", "gotcha"},
  });

  const auto destination = fixture.base() / "out";
  std::filesystem::create_directories(destination);
  auto reader = quire::archive::zip_reader{};
  ASSERT_TRUE(reader.open(archive));
  auto result = reader.extract_all(destination, 1 << 20);
  EXPECT_EQ(result.code, quire::common::error_code::invalid_archive);
  EXPECT_FALSE(std::filesystem::exists(fixture.base() / "escape.txt"));
  EXPECT_TRUE(quire::testing::snapshot_tree(destination).empty());
}

TEST(zip, archives_over_the_size_limit_are_rejected) {
  auto fixture = zip_fixture{"quire_zip_limit"};
  const auto archive = fixture.make_raw_archive({
      {"a.bin", std::string(600, 'a')},
      {"b.bin", std::string(600, 'b')},
  });

  const auto destination = fixture.base() / "out";
  std::filesystem::create_directories(destination);
  auto reader = quire::archive::zip_reader{};
  ASSERT_TRUE(reader.open(archive));
  auto result = reader.extract_all(destination, 1000);
  EXPECT_EQ(result.code, quire::common::error_code::invalid_archive);
  EXPECT_TRUE(quire::testing::snapshot_tree(destination).empty());
}

TEST(zip, non_zip_and_missing_files_are_invalid_archives) {
  auto fixture = zip_fixture{"quire_zip_invalid"};
  const auto text = fixture.base() / "notes.zip";
  quire::testing::write_text(text, "this is not a zip archive");

  auto reader = quire::archive::zip_reader{};
  EXPECT_EQ(reader.open(text).code,
            quire::common::error_code::invalid_archive);

  auto missing = quire::archive::zip_reader{};
  EXPECT_EQ(missing.open(fixture.base() / "absent.zip").code,
            quire::common::error_code::invalid_archive);
  EXPECT_EQ(missing.extract_all(fixture.base() / "out", 1 << 20).code,
            quire::common::error_code::invalid_archive);
}

TEST(zip, writer_reports_unwritable_destination) {
  auto fixture = zip_fixture{"quire_zip_unwritable"};
  auto writer = quire::archive::zip_writer{6};
  auto result = writer.open(fixture.base() / "missing-dir" / "x.zip");
  EXPECT_EQ(result.code, quire::common::error_code::archive_write_failed);
  EXPECT_EQ(writer.finalize().code,
            quire::common::error_code::archive_write_failed);
}
