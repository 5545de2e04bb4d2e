#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "poexam/project/project_config.hpp"

using poexam::find_project_config;
using poexam::load_project_config;
using poexam::parse_project_config;
using poexam::Severity;
namespace fs = std::filesystem;

TEST(ProjectConfig, EmptyDocumentKeepsDefaults)
{
  const auto result = parse_project_config("", "/project");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.check.select.empty());
  EXPECT_TRUE(result.config.check.ignore.empty());
  EXPECT_FALSE(result.config.check.fuzzy.has_value());
  EXPECT_FALSE(result.config.jobs.has_value());
  EXPECT_EQ(result.config.project_root, fs::path("/project"));
}

TEST(ProjectConfig, RuleListsAsSequenceOrString)
{
  const auto result = parse_project_config(
    "check:\n"
    "  select: [default, spelling]\n"
    "  ignore: \"brackets, pipes\"\n",
    "/project");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.check.select, (std::vector<std::string>{"default", "spelling"}));
  EXPECT_EQ(result.config.check.ignore, (std::vector<std::string>{"brackets", "pipes"}));
}

TEST(ProjectConfig, CheckOptions)
{
  const auto result = parse_project_config(
    "check:\n"
    "  fuzzy: true\n"
    "  noqa: false\n"
    "  obsolete: true\n"
    "  severity:\n"
    "    brackets: error\n"
    "    blank: info\n"
    "jobs: 4\n",
    "/project");
  ASSERT_TRUE(result.success) << result.error;
  const auto & check = result.config.check;
  EXPECT_EQ(check.fuzzy, true);
  EXPECT_EQ(check.noqa, false);
  EXPECT_EQ(check.obsolete, true);
  ASSERT_EQ(check.severity.size(), 2u);
  EXPECT_EQ(check.severity.at("brackets"), Severity::Error);
  EXPECT_EQ(check.severity.at("blank"), Severity::Info);
  EXPECT_EQ(result.config.jobs, 4u);
}

TEST(ProjectConfig, InvalidSeverity)
{
  const auto result = parse_project_config(
    "check:\n"
    "  severity:\n"
    "    brackets: fatal\n",
    "/project");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(
    result.error,
    "invalid severity 'fatal' for rule 'brackets' (must be 'info', 'warning' or 'error')");
}

TEST(ProjectConfig, JobsMustBePositive)
{
  const auto result = parse_project_config("jobs: 0\n", "/project");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "jobs must be a positive number");
}

TEST(ProjectConfig, InvalidStructure)
{
  EXPECT_EQ(parse_project_config("- a\n- b\n", "/p").error, "configuration must be a map");
  EXPECT_EQ(parse_project_config("check: 3\n", "/p").error, "check must be a map");
  EXPECT_EQ(
    parse_project_config("check:\n  select: {a: b}\n", "/p").error,
    "check.select must be a list");
  EXPECT_EQ(parse_project_config("spelling: [a]\n", "/p").error, "spelling must be a map");
}

TEST(ProjectConfig, MalformedYaml)
{
  const auto result = parse_project_config("check: [unclosed\n", "/project");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0u);
}

TEST(ProjectConfig, SpellingPathsAreResolvedAgainstTheProject)
{
  const auto result = parse_project_config(
    "spelling:\n"
    "  path_dicts: dicts/../hunspell\n"
    "  path_words: /usr/share/words\n"
    "  lang_id: en_GB\n",
    "/project");
  ASSERT_TRUE(result.success) << result.error;
  const auto & spelling = result.config.spelling;
  EXPECT_EQ(spelling.path_dicts, fs::path("/project/hunspell"));
  EXPECT_EQ(spelling.path_words, fs::path("/usr/share/words"));
  EXPECT_EQ(spelling.lang_id, "en_GB");
}

namespace
{

class ProjectConfigFileTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "poexam_test_project_config";
    fs::remove_all(root_);
    fs::create_directories(root_ / "po" / "sub");
  }

  void TearDown() override { fs::remove_all(root_); }

  void write_config(const std::string & content) const
  {
    std::ofstream(root_ / poexam::k_project_config_file_name) << content;
  }

  fs::path root_;
};

}  // namespace

TEST_F(ProjectConfigFileTest, FindSearchesParentDirectories)
{
  write_config("jobs: 2\n");
  const auto found = find_project_config(root_ / "po" / "sub");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, root_ / poexam::k_project_config_file_name);
}

TEST_F(ProjectConfigFileTest, LoadResolvesAgainstConfigDirectory)
{
  write_config("spelling:\n  path_words: words\n");
  const auto result = load_project_config(root_ / poexam::k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, root_);
  EXPECT_EQ(result.config.spelling.path_words, root_ / "words");
}

TEST_F(ProjectConfigFileTest, LoadMissingFile)
{
  const fs::path missing = root_ / "missing.yaml";
  const auto result = load_project_config(missing);
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration file not found: " + missing.string());
}
