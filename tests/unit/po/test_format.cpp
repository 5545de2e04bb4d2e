#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "poexam/po/format.hpp"
#include "poexam/po/words.hpp"

using namespace poexam::po;

namespace
{

std::vector<std::string> texts(const std::vector<TextSpan> & spans)
{
  std::vector<std::string> out;
  for (const auto & s : spans) {
    out.emplace_back(s.text);
  }
  return out;
}

}  // namespace

TEST(PoFormat, FindsCSpecifiers)
{
  const auto formats = find_formats("Name: %s, age: %d, ratio: %5.2f%%", FormatLanguage::C);
  EXPECT_EQ(texts(formats), (std::vector<std::string>{"%s", "%d", "%5.2f"}));
  ASSERT_EQ(formats.size(), 3u);
  EXPECT_EQ(formats[0].start, 6u);
  EXPECT_EQ(formats[0].end, 8u);
}

TEST(PoFormat, PositionalAndLengthModifiers)
{
  EXPECT_EQ(
    texts(find_formats("%2$d %1$s %lld %zu", FormatLanguage::C)),
    (std::vector<std::string>{"%2$d", "%1$s", "%lld", "%zu"}));
}

TEST(PoFormat, TrailingPercentIsNotASpecifier)
{
  EXPECT_TRUE(find_formats("100%", FormatLanguage::C).empty());
  EXPECT_TRUE(find_formats("%", FormatLanguage::C).empty());
  EXPECT_EQ(texts(find_formats("%d%", FormatLanguage::C)), (std::vector<std::string>{"%d"}));
}

TEST(PoFormat, PythonSpecifiers)
{
  EXPECT_EQ(
    texts(find_formats("%(name)s has %d items", FormatLanguage::Python)),
    (std::vector<std::string>{"%(name)s", "%d"}));
  EXPECT_EQ(
    texts(find_formats("{0} and {name} but not {{this}}", FormatLanguage::PythonBrace)),
    (std::vector<std::string>{"{0}", "{name}"}));
}

TEST(PoFormat, NoLanguageFindsNothing)
{
  EXPECT_TRUE(find_formats("%s {0}", FormatLanguage::None).empty());
}

TEST(PoFormat, SortIndexAndStrip)
{
  EXPECT_EQ(format_sort_index("%3$d"), 3u);
  EXPECT_EQ(format_sort_index("%d"), k_no_format_index);
  EXPECT_EQ(format_sort_index("{0}"), k_no_format_index);
  EXPECT_EQ(format_strip_index("%3$d"), "%d");
  EXPECT_EQ(format_strip_index("%s"), "%s");
}

TEST(PoFormat, LanguageNames)
{
  EXPECT_EQ(format_language_from_name("c"), FormatLanguage::C);
  EXPECT_EQ(format_language_from_name("python-brace"), FormatLanguage::PythonBrace);
  EXPECT_EQ(format_language_from_name("perl"), FormatLanguage::None);
  EXPECT_EQ(format_language_display_name(FormatLanguage::Python), "Python");
}

TEST(PoWords, SplitsWordsAndSkipsFormats)
{
  EXPECT_EQ(
    texts(find_words("Hello, %s! Re-open the file.", FormatLanguage::C)),
    (std::vector<std::string>{"Hello", "Re-open", "the", "file"}));
  EXPECT_EQ(count_words("%s%d", FormatLanguage::C), 0u);
  EXPECT_EQ(count_words("%s%d", FormatLanguage::None), 2u);
}

TEST(PoWords, CountsWordCharacters)
{
  EXPECT_EQ(count_word_chars("a-b c!", FormatLanguage::None), 4u);
  EXPECT_EQ(count_word_chars("\xC3\xA9t\xC3\xA9 %s", FormatLanguage::C), 3u);
}
