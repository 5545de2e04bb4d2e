#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "poexam/driver/pipeline.hpp"
#include "poexam/test_support/lint_helpers.hpp"

using poexam::driver::FileResult;
using poexam::driver::Pipeline;
using poexam::driver::ScanOptions;
using poexam::driver::run_parallel;
namespace fs = std::filesystem;

TEST(DriverRunParallel, ResultsAreSortedWhateverTheCompletionOrder)
{
  std::vector<std::string> files;
  for (int i = 19; i >= 0; --i) {
    files.push_back("file" + std::to_string(100 + i) + ".po");
  }
  std::vector<int> delays;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 15);
  for (size_t i = 0; i < files.size(); ++i) {
    delays.push_back(dist(rng));
  }

  const auto results = run_parallel(files, 4, [&files, &delays](const std::string & path) {
    for (size_t i = 0; i < files.size(); ++i) {
      if (files[i] == path) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delays[i]));
      }
    }
    FileResult r;
    r.path = path;
    return r;
  });

  ASSERT_EQ(results.size(), files.size());
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].path, "file" + std::to_string(100 + i) + ".po");
  }
}

TEST(DriverRunParallel, ThrowingTaskGivesReadErrorForThatFile)
{
  const std::vector<std::string> files = {"a.po", "b.po", "c.po", "d.po"};
  const auto results = run_parallel(files, 2, [](const std::string & path) {
    if (path == "b.po") {
      throw std::runtime_error("out of buffers");
    }
    FileResult r;
    r.path = path;
    return r;
  });

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[1].path, "b.po");
  EXPECT_FALSE(results[1].read_ok);
  ASSERT_EQ(results[1].diagnostics.size(), 1u);
  EXPECT_EQ(results[1].diagnostics[0].rule, "read-error");
  EXPECT_EQ(results[1].diagnostics[0].message, "out of buffers");
  for (const size_t i : {0u, 2u, 3u}) {
    EXPECT_TRUE(results[i].read_ok);
    EXPECT_TRUE(results[i].diagnostics.empty());
  }
}

TEST(DriverRunParallel, NoFilesNoResults)
{
  const std::vector<std::string> none;
  const auto results = run_parallel(none, 8, [](const std::string & path) {
    FileResult r;
    r.path = path;
    return r;
  });
  EXPECT_TRUE(results.empty());
}

namespace
{

class PipelineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "poexam_test_pipeline";
    fs::remove_all(root_);
    fs::create_directories(root_);
    write("fr.po", poexam::test_support::entry_po("Test [brackets]", "Test crochets"));
    write("de.po", poexam::test_support::entry_po("Hello", "Hallo"));
    write("es.po", poexam::test_support::entry_po("Hello", ""));
  }

  void TearDown() override { fs::remove_all(root_); }

  void write(const std::string & name, const std::string & content) const
  {
    std::ofstream(root_ / name, std::ios::binary) << content;
  }

  [[nodiscard]] std::string path_of(const std::string & name) const
  {
    return (root_ / name).generic_string();
  }

  fs::path root_;
};

}  // namespace

TEST_F(PipelineTest, CheckLintsEveryFile)
{
  const auto rules = poexam::test_support::select_rules("default");
  ScanOptions options;
  options.jobs = 2;
  const Pipeline pipeline(options);
  const auto scan = pipeline.check({root_.string()}, *rules);
  ASSERT_TRUE(scan.success) << scan.error;
  EXPECT_TRUE(scan.warnings.empty());

  ASSERT_EQ(scan.files.size(), 3u);
  EXPECT_EQ(scan.files[0].path, path_of("de.po"));
  EXPECT_TRUE(scan.files[0].diagnostics.empty());
  EXPECT_EQ(scan.files[1].path, path_of("es.po"));
  EXPECT_TRUE(scan.files[1].diagnostics.empty());
  EXPECT_EQ(scan.files[2].path, path_of("fr.po"));
  ASSERT_EQ(scan.files[2].diagnostics.size(), 1u);
  EXPECT_EQ(scan.files[2].diagnostics[0].rule, "brackets");
  EXPECT_EQ(scan.files[2].diagnostics[0].path, path_of("fr.po"));

  for (const auto & file : scan.files) {
    ASSERT_TRUE(file.stats.has_value()) << file.path;
    EXPECT_EQ(file.stats->path, file.path);
    EXPECT_EQ(file.stats->entries.total, 1u);
  }
  EXPECT_EQ(scan.files[0].stats->entries.translated, 1u);
  EXPECT_EQ(scan.files[1].stats->entries.untranslated, 1u);
}

TEST_F(PipelineTest, MissingSourceDictionaryIsAWarning)
{
  const auto rules = poexam::test_support::select_rules("spelling-id");
  ScanOptions options;
  options.spelling.path_dicts = root_ / "no-dicts";
  options.spelling.lang_id = "en_US";
  const Pipeline pipeline(options);
  const auto scan = pipeline.check({root_.string()}, *rules);
  ASSERT_TRUE(scan.success);
  ASSERT_EQ(scan.warnings.size(), 1u);
  EXPECT_NE(scan.warnings[0].find("dictionary not found for language 'en_US'"), std::string::npos);
  for (const auto & file : scan.files) {
    EXPECT_TRUE(file.diagnostics.empty());
  }
}

TEST_F(PipelineTest, UnreadableFileGivesReadError)
{
  const Pipeline pipeline(ScanOptions{});
  const auto rules = poexam::test_support::select_rules("default");
  const poexam::engine::Linter linter(*rules);
  const auto result = pipeline.process_file(path_of("missing.po"), &linter);
  EXPECT_FALSE(result.read_ok);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].rule, "read-error");
  EXPECT_EQ(result.diagnostics[0].severity, poexam::Severity::Error);
  EXPECT_EQ(result.diagnostics[0].message, "could not open file");
}

TEST_F(PipelineTest, UnsupportedEncodingGivesReadError)
{
  ScanOptions options;
  options.encoding = "NOT-A-CHARSET";
  const Pipeline pipeline(options);
  const auto scan = pipeline.stats({path_of("fr.po")});
  ASSERT_TRUE(scan.success);
  ASSERT_EQ(scan.files.size(), 1u);
  EXPECT_FALSE(scan.files[0].read_ok);
  EXPECT_FALSE(scan.files[0].stats.has_value());
  ASSERT_EQ(scan.files[0].diagnostics.size(), 1u);
  EXPECT_EQ(scan.files[0].diagnostics[0].message, "unsupported encoding 'NOT-A-CHARSET'");
}

TEST_F(PipelineTest, StatsCountsEntries)
{
  const Pipeline pipeline(ScanOptions{});
  const auto scan = pipeline.stats({root_.string()});
  ASSERT_TRUE(scan.success);
  ASSERT_EQ(scan.files.size(), 3u);
  ASSERT_TRUE(scan.files[1].stats.has_value());
  EXPECT_EQ(scan.files[1].stats->path, path_of("es.po"));
  EXPECT_EQ(scan.files[1].stats->entries.total, 1u);
  EXPECT_EQ(scan.files[1].stats->entries.untranslated, 1u);
  EXPECT_FALSE(scan.files[1].stats->words.has_value());
}

TEST_F(PipelineTest, MissingRootFailsTheScan)
{
  const Pipeline pipeline(ScanOptions{});
  const auto scan = pipeline.stats({path_of("nope")});
  EXPECT_FALSE(scan.success);
  EXPECT_EQ(scan.error, "path not found: " + path_of("nope"));
}
