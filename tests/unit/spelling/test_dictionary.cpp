#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "poexam/po/charset.hpp"
#include "poexam/spelling/dictionary.hpp"
#include "poexam/spelling/spell_check.hpp"
#include "poexam/test_support/dictionary_helpers.hpp"

using namespace poexam::spelling;
using poexam::test_support::dic_contents;
using poexam::test_support::make_dictionary;
using poexam::test_support::make_scratch_dir;
using poexam::test_support::write_file;
namespace fs = std::filesystem;

namespace
{

constexpr std::string_view k_aff =
  "SET UTF-8\n"
  "# plural forms\n"
  "SFX S Y 2\n"
  "SFX S y ies [^aeiou]y\n"
  "SFX S 0 s [^y]\n"
  "PFX U Y 1\n"
  "PFX U 0 un .\n"
  "FORBIDDENWORD !\n";

const std::vector<std::string> k_words = {
  "file/S", "city/S", "read/U", "do/US", "irregardless/!"};

}  // namespace

TEST(SpellingDictionary, ChecksAffixedWordsAndCaseVariants)
{
  const auto loaded = make_dictionary(k_words, k_aff);
  const Dictionary & dict = *loaded.dictionary;

  EXPECT_TRUE(dict.check("file"));
  EXPECT_TRUE(dict.check("files"));
  EXPECT_TRUE(dict.check("cities"));
  EXPECT_TRUE(dict.check("unread"));
  EXPECT_TRUE(dict.check("undos"));
  EXPECT_TRUE(dict.check("File"));
  EXPECT_TRUE(dict.check("FILES"));
  EXPECT_FALSE(dict.check("citys"));
  EXPECT_FALSE(dict.check("unfile"));
  EXPECT_FALSE(dict.check("irregardless"));
  EXPECT_EQ(dict.encoding(), "UTF-8");
}

TEST(SpellingDictionary, CompoundWords)
{
  const auto loaded = make_dictionary(
    {"foot/X", "ball/X", "room"}, "SET UTF-8\nCOMPOUNDFLAG X\n");
  const Dictionary & dict = *loaded.dictionary;

  EXPECT_TRUE(dict.check("football"));
  EXPECT_TRUE(dict.check("ballfoot"));
  EXPECT_FALSE(dict.check("footroom"));
}

TEST(SpellingDictionary, HyphensAndNumbers)
{
  const auto loaded = make_dictionary(k_words, k_aff);
  const Dictionary & dict = *loaded.dictionary;

  EXPECT_TRUE(dict.check("read-file"));
  EXPECT_FALSE(dict.check("read-fille"));
  EXPECT_TRUE(dict.check("42"));
  EXPECT_TRUE(dict.check("---"));
}

TEST(SpellingDictionary, SharedBetweenThreads)
{
  const auto loaded = make_dictionary(k_words, k_aff);
  const Dictionary & dict = *loaded.dictionary;

  std::vector<std::thread> threads;
  std::vector<int> accepted(4, 0);
  for (size_t i = 0; i < accepted.size(); ++i) {
    threads.emplace_back([&dict, &accepted, i] {
      for (int n = 0; n < 200; ++n) {
        accepted[i] += dict.check("cities") ? 1 : 0;
        accepted[i] += dict.check("citys") ? 1 : 0;
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }
  for (const int count : accepted) {
    EXPECT_EQ(count, 200);
  }
}

TEST(SpellingDictionary, ExtraWords)
{
  const fs::path dir = make_scratch_dir("poexam_extra_words");
  write_file(dir / "en.aff", k_aff);
  write_file(dir / "en.dic", dic_contents(k_words));
  write_file(dir / "words.dic", "poexam\nmsgid/X\n\n");

  const auto loaded = Dictionary::load(
    dir / "en.aff", dir / "en.dic", {dir / "missing.dic", dir / "words.dic"});
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_TRUE(loaded.dictionary->check("poexam"));
  EXPECT_TRUE(loaded.dictionary->check("msgid"));
  EXPECT_FALSE(loaded.dictionary->check("msgstr"));

  fs::remove_all(dir);
}

TEST(SpellingDictionary, MissingFilesFailToLoad)
{
  const auto loaded = Dictionary::load("/nonexistent/en.aff", "/nonexistent/en.dic");
  EXPECT_FALSE(loaded.success);
  EXPECT_EQ(loaded.error, "cannot read file: /nonexistent/en.aff");
}

TEST(SpellingDictionary, Latin1Dictionary)
{
  // "été" and "où" in ISO-8859-1
  const auto loaded = make_dictionary({"\xE9t\xE9", "o\xF9"}, "SET ISO8859-1\n");
  const Dictionary & dict = *loaded.dictionary;

  EXPECT_TRUE(dict.check("\xC3\xA9t\xC3\xA9"));
  EXPECT_TRUE(dict.check("o\xC3\xB9"));
  // Not representable in Latin-1
  EXPECT_FALSE(dict.check("\xC5\x93uvre"));
}

TEST(SpellingDictionary, CheckWordsReportsEachMisspellingOnce)
{
  const auto loaded = make_dictionary(k_words, k_aff);
  const auto result =
    check_words("fille %s cities fille zzz", poexam::po::FormatLanguage::C, *loaded.dictionary);
  EXPECT_EQ(result.words, (std::vector<std::string>{"fille", "zzz"}));
  EXPECT_EQ(
    result.highlights, (std::vector<poexam::Highlight>{{0, 5}, {16, 21}, {22, 25}}));
}

TEST(SpellingDictionary, LoadsByLanguageWithFallbackAndExtraWords)
{
  const fs::path dir = make_scratch_dir("poexam_test_dictionary");
  fs::create_directories(dir / "dicts");
  fs::create_directories(dir / "words");
  write_file(dir / "dicts" / "en.aff", k_aff);
  write_file(dir / "dicts" / "en.dic", dic_contents(k_words));
  write_file(dir / "words" / "en.dic", "poexam\nmsgid/X\n");

  const auto loaded = load_dictionary(dir / "dicts", dir / "words", "en_US");
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_TRUE(loaded.dictionary->check("cities"));
  EXPECT_TRUE(loaded.dictionary->check("poexam"));
  EXPECT_TRUE(loaded.dictionary->check("msgid"));

  const auto missing = load_dictionary(dir / "dicts", std::nullopt, "xx");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("dictionary not found for language 'xx'"), std::string::npos);

  fs::remove_all(dir);
}

TEST(PoCharsetEncoder, EncodesOrRejects)
{
  auto latin1 = poexam::po::CharsetEncoder::open("ISO-8859-1");
  ASSERT_TRUE(latin1);
  EXPECT_EQ(latin1->encode("caf\xC3\xA9"), std::optional<std::string>("caf\xE9"));
  EXPECT_FALSE(latin1->encode("\xE2\x82\xAC").has_value());
  EXPECT_FALSE(latin1->encode("\xFF").has_value());

  auto utf8 = poexam::po::CharsetEncoder::open("utf8");
  ASSERT_TRUE(utf8);
  EXPECT_EQ(utf8->encode("\xE2\x82\xAC"), std::optional<std::string>("\xE2\x82\xAC"));

  EXPECT_FALSE(poexam::po::CharsetEncoder::open("NO-SUCH-CHARSET"));
}
