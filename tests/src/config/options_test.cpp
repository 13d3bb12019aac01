#include <quire/config/options.hpp>
#include <quire/testing/common.hpp>
#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <filesystem>

namespace po = boost::program_options;

namespace {

template <std::size_t N>
void parse(const std::array<const char*, N>& argv,
           const po::options_description& description,
           po::variables_map& vm) {
  po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(),
                                   description),
            vm);
}

}  // namespace

TEST(options, defaults_are_valid) {
  auto o = quire::config::make_default_options();
  EXPECT_EQ(o.database_path, "quire.db");
  EXPECT_EQ(o.blob_root, std::filesystem::path{"uploads"});
  EXPECT_FALSE(o.temp_root.empty());
  EXPECT_EQ(o.compression_level, 9u);
  EXPECT_EQ(o.on_failure, quire::restore::failure_policy::abort);
  EXPECT_TRUE(o.remove_archive_after_restore);
  EXPECT_TRUE(quire::config::validate_options(o));
}

TEST(options, command_line_overrides_defaults) {
  auto o = quire::config::make_default_options();
  auto description = quire::config::describe_options(o);
  auto vm = po::variables_map{};
  parse(std::array{"quire", "--database", "/srv/quire/db", "--blob-root",
                   "/srv/quire/uploads", "--compression-level", "3",
                   "--failure-policy", "best_effort", "--remove-archive",
                   "false"},
        description, vm);
  po::notify(vm);

  EXPECT_EQ(o.database_path, "/srv/quire/db");
  EXPECT_EQ(o.blob_root, std::filesystem::path{"/srv/quire/uploads"});
  EXPECT_EQ(o.compression_level, 3u);
  EXPECT_EQ(o.on_failure, quire::restore::failure_policy::best_effort);
  EXPECT_FALSE(o.remove_archive_after_restore);
}

TEST(options, unknown_failure_policy_is_a_validation_error) {
  auto o = quire::config::make_default_options();
  auto description = quire::config::describe_options(o);
  auto vm = po::variables_map{};
  parse(std::array{"quire", "--failure-policy", "sometimes"}, description, vm);
  EXPECT_THROW(po::notify(vm), po::validation_error);
}

TEST(options, config_file_fills_in_what_the_command_line_left_out) {
  const auto base = std::filesystem::path{
      quire::testing::make_db_path("quire_options_file")};
  const auto file = base / "quire.conf";
  quire::testing::write_text(file,
                             "# quire settings\n"
                             "database = /from/file/db\n"
                             "temp-root = /from/file/tmp\n"
                             "failure-policy = best_effort\n"
                             "unrelated-key = ignored\n");

  auto o = quire::config::make_default_options();
  auto description = quire::config::describe_options(o);
  auto vm = po::variables_map{};
  parse(std::array{"quire", "--database", "/from/cli/db"}, description, vm);
  ASSERT_TRUE(quire::config::load_config_file(file, description, vm));
  po::notify(vm);

  EXPECT_EQ(o.database_path, "/from/cli/db");
  EXPECT_EQ(o.temp_root, std::filesystem::path{"/from/file/tmp"});
  EXPECT_EQ(o.on_failure, quire::restore::failure_policy::best_effort);
  quire::testing::remove_path(base);
}

TEST(options, unreadable_config_files_are_reported) {
  const auto base = std::filesystem::path{
      quire::testing::make_db_path("quire_options_bad_file")};
  auto o = quire::config::make_default_options();
  auto description = quire::config::describe_options(o);
  auto vm = po::variables_map{};

  EXPECT_EQ(
      quire::config::load_config_file(base / "absent.conf", description, vm)
          .code,
      quire::common::error_code::io_failure);

  const auto file = base / "broken.conf";
  quire::testing::write_text(file, "compression-level = lots\n");
  EXPECT_EQ(quire::config::load_config_file(file, description, vm).code,
            quire::common::error_code::invalid_configuration);
  quire::testing::remove_path(base);
}

TEST(options, out_of_range_settings_are_rejected) {
  auto o = quire::config::make_default_options();
  o.compression_level = 11;
  EXPECT_EQ(quire::config::validate_options(o).code,
            quire::common::error_code::invalid_configuration);

  o = quire::config::make_default_options();
  o.max_extracted_bytes = 0;
  EXPECT_EQ(quire::config::validate_options(o).code,
            quire::common::error_code::invalid_configuration);

  o = quire::config::make_default_options();
  o.temp_root.clear();
  EXPECT_FALSE(quire::config::validate_options(o));
}
