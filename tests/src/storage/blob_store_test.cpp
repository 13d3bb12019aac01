#include <quire/archive/temp_workspace.hpp>
#include <quire/storage/blob_store.hpp>
#include <quire/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>

namespace {

class blob_fixture final {
 public:
  explicit blob_fixture(const std::string_view prefix)
      : base_{quire::testing::make_db_path(prefix)}, blobs_{base_ / "uploads"} {}

  ~blob_fixture() { quire::testing::remove_path(base_); }

  const std::filesystem::path& base() const { return base_; }
  quire::storage::blob_store& blobs() { return blobs_; }

  void put(const std::string& workspace_id,
           const std::string& relative,
           const std::string& content) {
    quire::testing::write_text(blobs_.workspace_root(workspace_id) / relative,
                               content);
  }

 private:
  std::filesystem::path base_;
  quire::storage::blob_store blobs_;
};

}  // namespace

TEST(blob_store, blob_kind_names_match_archive_directories) {
  EXPECT_EQ(quire::storage::to_string(quire::storage::blob_kind::documents),
            "documents");
  EXPECT_EQ(quire::storage::to_string(quire::storage::blob_kind::notes),
            "notes");
  EXPECT_EQ(quire::storage::to_string(quire::storage::blob_kind::vectors),
            "vectors");
}

TEST(blob_store, export_copies_present_trees_and_skips_missing_ones) {
  auto fixture = blob_fixture{"quire_blob_export"};
  fixture.put("ws-1", "documents/a.pdf", "%PDF-1.7");
  fixture.put("ws-1", "documents/nested/b.txt", "b");
  fixture.put("ws-1", "notes/n-1.md", "# n-1");

  const auto destination = fixture.base() / "out";
  ASSERT_TRUE(fixture.blobs().export_tree("ws-1", destination));

  auto expected = std::map<std::string, std::string>{
      {"documents/", ""},
      {"documents/a.pdf", "%PDF-1.7"},
      {"documents/nested/", ""},
      {"documents/nested/b.txt", "b"},
      {"notes/", ""},
      {"notes/n-1.md", "# n-1"},
  };
  EXPECT_EQ(quire::testing::snapshot_tree(destination), expected);
  EXPECT_FALSE(std::filesystem::exists(destination / "vectors"));
}

TEST(blob_store, export_of_workspace_without_blobs_is_not_an_error) {
  auto fixture = blob_fixture{"quire_blob_export_empty"};
  const auto destination = fixture.base() / "out";
  EXPECT_TRUE(fixture.blobs().export_tree("ws-none", destination));
  EXPECT_TRUE(quire::testing::snapshot_tree(destination).empty());
}

TEST(blob_store, install_replaces_the_whole_workspace_tree) {
  auto fixture = blob_fixture{"quire_blob_install"};
  fixture.put("ws-1", "documents/stale.pdf", "old");
  fixture.put("ws-1", "vectors/index.bin", "old-vectors");
  fixture.put("ws-2", "documents/other.pdf", "untouched");

  const auto source = fixture.base() / "extracted";
  quire::testing::write_text(source / "documents/fresh.pdf", "new");
  std::filesystem::create_directories(source / "notes");

  auto result = quire::common::status{};
  auto staging = fixture.blobs().begin_staging("ws-1", result);
  ASSERT_TRUE(staging.has_value()) << result.info;
  ASSERT_TRUE(fixture.blobs().stage_tree(source, *staging));
  ASSERT_TRUE(fixture.blobs().install("ws-1", *staging));
  EXPECT_TRUE(staging->released());

  auto expected = std::map<std::string, std::string>{
      {"documents/", ""},
      {"documents/fresh.pdf", "new"},
      {"notes/", ""},
  };
  EXPECT_EQ(quire::testing::snapshot_tree(
                fixture.blobs().workspace_root("ws-1")),
            expected);
  EXPECT_EQ(quire::testing::read_text(fixture.blobs().workspace_root("ws-2") /
                                      "documents/other.pdf"),
            "untouched");
  EXPECT_EQ(quire::testing::count_entries(fixture.blobs().reserved_root(), ""),
            0u);
}

TEST(blob_store, install_creates_a_workspace_that_did_not_exist) {
  auto fixture = blob_fixture{"quire_blob_install_new"};
  const auto source = fixture.base() / "extracted";
  quire::testing::write_text(source / "notes/n-1.md", "# n-1");

  auto result = quire::common::status{};
  auto staging = fixture.blobs().begin_staging("ws-new", result);
  ASSERT_TRUE(staging.has_value()) << result.info;
  ASSERT_TRUE(fixture.blobs().stage_tree(source, *staging));
  EXPECT_FALSE(fixture.blobs().has_workspace("ws-new"));
  ASSERT_TRUE(fixture.blobs().install("ws-new", *staging));
  EXPECT_TRUE(fixture.blobs().has_workspace("ws-new"));
}

TEST(blob_store, abandoned_staging_leaves_live_tree_untouched) {
  auto fixture = blob_fixture{"quire_blob_abandon"};
  fixture.put("ws-1", "documents/a.pdf", "live");
  const auto before =
      quire::testing::snapshot_tree(fixture.blobs().workspace_root("ws-1"));

  const auto source = fixture.base() / "extracted";
  quire::testing::write_text(source / "documents/b.pdf", "staged");
  {
    auto result = quire::common::status{};
    auto staging = fixture.blobs().begin_staging("ws-1", result);
    ASSERT_TRUE(staging.has_value()) << result.info;
    ASSERT_TRUE(fixture.blobs().stage_tree(source, *staging));
  }

  EXPECT_EQ(quire::testing::snapshot_tree(
                fixture.blobs().workspace_root("ws-1")),
            before);
  EXPECT_EQ(quire::testing::count_entries(fixture.blobs().reserved_root(), ""),
            0u);
}

TEST(blob_store, install_of_released_staging_keeps_previous_tree) {
  auto fixture = blob_fixture{"quire_blob_rollback"};
  fixture.put("ws-1", "documents/a.pdf", "live");

  auto result = quire::common::status{};
  auto staging = fixture.blobs().begin_staging("ws-1", result);
  ASSERT_TRUE(staging.has_value()) << result.info;
  staging->release();

  auto installed = fixture.blobs().install("ws-1", *staging);
  EXPECT_FALSE(installed);
  EXPECT_EQ(installed.code, quire::common::error_code::io_failure);
  EXPECT_EQ(quire::testing::read_text(fixture.blobs().workspace_root("ws-1") /
                                      "documents/a.pdf"),
            "live");
}

TEST(blob_store, remove_workspace_is_idempotent) {
  auto fixture = blob_fixture{"quire_blob_remove"};
  fixture.put("ws-1", "documents/a.pdf", "x");
  EXPECT_TRUE(fixture.blobs().remove_workspace("ws-1"));
  EXPECT_FALSE(fixture.blobs().has_workspace("ws-1"));
  EXPECT_TRUE(fixture.blobs().remove_workspace("ws-1"));
}

TEST(blob_store, bookkeeping_stays_out_of_other_workspace_trees) {
  auto fixture = blob_fixture{"quire_blob_reserved"};
  fixture.put("x", "documents/old.pdf", "old");
  // Written straight to disk: no valid workspace id can name these paths.
  quire::testing::write_text(
      fixture.blobs().root() / ".x.retired/documents/precious.pdf", "keep");
  quire::testing::write_text(
      fixture.blobs().root() / ".x.staging/documents/precious.pdf", "keep");

  const auto source = fixture.base() / "extracted";
  quire::testing::write_text(source / "documents/new.pdf", "new");

  auto result = quire::common::status{};
  auto staging = fixture.blobs().begin_staging("x", result);
  ASSERT_TRUE(staging.has_value()) << result.info;
  EXPECT_EQ(staging->path().parent_path(), fixture.blobs().reserved_root());
  ASSERT_TRUE(fixture.blobs().stage_tree(source, *staging));
  ASSERT_TRUE(fixture.blobs().install("x", *staging));

  EXPECT_EQ(quire::testing::read_text(fixture.blobs().root() /
                                      ".x.retired/documents/precious.pdf"),
            "keep");
  EXPECT_EQ(quire::testing::read_text(fixture.blobs().root() /
                                      ".x.staging/documents/precious.pdf"),
            "keep");
  EXPECT_EQ(quire::testing::read_text(fixture.blobs().workspace_root("x") /
                                      "documents/new.pdf"),
            "new");
  EXPECT_FALSE(std::filesystem::exists(fixture.blobs().workspace_root("x") /
                                       "documents/old.pdf"));
  EXPECT_EQ(quire::testing::count_entries(fixture.blobs().reserved_root(), ""),
            0u);
}

TEST(blob_store, legacy_uploads_copy_is_split_into_sub_trees) {
  auto fixture = blob_fixture{"quire_blob_legacy"};
  fixture.put("ws-1", "documents/stale.pdf", "old");

  // Older archives copied the whole blob root into `documents`.
  const auto source = fixture.base() / "extracted";
  quire::testing::write_text(source / "documents/report.pdf", "loose");
  quire::testing::write_text(source / "documents/documents/a.pdf", "nested");
  quire::testing::write_text(source / "documents/notes/n-1.md", "# copy");
  quire::testing::write_text(source / "documents/vectors/index.bin", "vec");
  quire::testing::write_text(source / "documents/images/p.png", "png");
  quire::testing::write_text(source / "notes/n-1.md", "# n-1");

  auto result = quire::common::status{};
  auto staging = fixture.blobs().begin_staging("ws-1", result);
  ASSERT_TRUE(staging.has_value()) << result.info;
  ASSERT_TRUE(fixture.blobs().stage_legacy_tree(source, *staging));
  ASSERT_TRUE(fixture.blobs().install("ws-1", *staging));

  auto expected = std::map<std::string, std::string>{
      {"documents/", ""},
      {"documents/a.pdf", "nested"},
      {"documents/images/", ""},
      {"documents/images/p.png", "png"},
      {"documents/report.pdf", "loose"},
      {"notes/", ""},
      {"notes/n-1.md", "# n-1"},
      {"vectors/", ""},
      {"vectors/index.bin", "vec"},
  };
  EXPECT_EQ(quire::testing::snapshot_tree(
                fixture.blobs().workspace_root("ws-1")),
            expected);
}
