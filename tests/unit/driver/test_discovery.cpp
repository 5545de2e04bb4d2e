#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "poexam/basic/file_io.hpp"
#include "poexam/driver/discovery.hpp"

using poexam::driver::find_po_files;
using poexam::driver::normalize_path;
namespace fs = std::filesystem;

namespace
{

class DiscoveryTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "poexam_test_discovery";
    fs::remove_all(root_);
    fs::create_directories(root_ / "po" / "sub");
    fs::create_directories(root_ / ".git");
    touch(root_ / "po" / "fr.po");
    touch(root_ / "po" / "de.po");
    touch(root_ / "po" / "sub" / "pt_BR.po");
    touch(root_ / "po" / "messages.pot");
    touch(root_ / "po" / ".hidden.po");
    touch(root_ / ".git" / "x.po");
  }

  void TearDown() override { fs::remove_all(root_); }

  static void touch(const fs::path & path) { std::ofstream(path) << "msgid \"\"\nmsgstr \"\"\n"; }

  [[nodiscard]] std::string path_of(const fs::path & relative) const
  {
    return (root_ / relative).generic_string();
  }

  fs::path root_;
};

}  // namespace

TEST_F(DiscoveryTest, WalksDirectoriesForPoFiles)
{
  const auto result = find_po_files({root_.string()});
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(
    result.files, (std::vector<std::string>{
                    path_of("po/de.po"), path_of("po/fr.po"), path_of("po/sub/pt_BR.po")}));
}

TEST_F(DiscoveryTest, FilesAreTakenAsIsAndDeduplicated)
{
  const std::string pot = path_of("po/messages.pot");
  const auto result = find_po_files({pot, (root_ / "po").string(), path_of("po/fr.po")});
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(
    result.files,
    (std::vector<std::string>{
      path_of("po/de.po"), path_of("po/fr.po"), path_of("po/messages.pot"),
      path_of("po/sub/pt_BR.po")}));
}

TEST_F(DiscoveryTest, MissingRootFails)
{
  const std::string missing = path_of("nope");
  const auto result = find_po_files({missing});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "path not found: " + missing);
}

TEST(Discovery, NormalizePath)
{
  EXPECT_EQ(normalize_path("./po/fr.po"), "po/fr.po");
  EXPECT_EQ(normalize_path("././fr.po"), "fr.po");
  EXPECT_EQ(normalize_path("po/fr.po"), "po/fr.po");
  EXPECT_EQ(normalize_path("/abs/fr.po"), "/abs/fr.po");
}

TEST(FileIo, ReadErrors)
{
  const auto missing = poexam::read_file("/nonexistent/poexam/file.po");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error, "could not open file");
  EXPECT_FALSE(poexam::read_file_to_string("/nonexistent/poexam/file.po").has_value());

  const fs::path file = fs::temp_directory_path() / "poexam_test_file_io.po";
  std::ofstream(file, std::ios::binary) << "abc\r\n";
  const auto read = poexam::read_file(file);
  ASSERT_TRUE(read.success);
  EXPECT_EQ(read.content, "abc\r\n");
  fs::remove(file);
}

TEST_F(DiscoveryTest, UnreadableSubdirectoriesAreSkipped)
{
  const fs::path locked = root_ / "po" / "locked";
  fs::create_directories(locked);
  touch(locked / "it.po");
  fs::permissions(locked, fs::perms::none);

  std::error_code ec;
  fs::directory_iterator listing(locked, ec);
  if (!ec) {
    fs::permissions(locked, fs::perms::owner_all);
    GTEST_SKIP() << "directory permissions are not enforced for this user";
  }

  const auto result = find_po_files({root_.string()});
  fs::permissions(locked, fs::perms::owner_all);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(
    result.files, (std::vector<std::string>{
                    path_of("po/de.po"), path_of("po/fr.po"), path_of("po/sub/pt_BR.po")}));
}
