#include <labelscan/text/dictionaries.hpp>
#include <labelscan/text/similarity.hpp>
#include <gtest/gtest.h>
#include <string_view>

namespace nt = labelscan::text;

TEST(Similarity, EditDistance) {
  EXPECT_EQ(nt::edit_distance("kitten", "sitting"), 3u);
  EXPECT_EQ(nt::edit_distance("", "abc"), 3u);
  EXPECT_EQ(nt::edit_distance("rue", "rue"), 0u);
}

TEST(Similarity, EditSimilarityBounds) {
  EXPECT_FLOAT_EQ(nt::edit_similarity("", ""), 1.f);
  EXPECT_FLOAT_EQ(nt::edit_similarity("abc", "xyz"), 0.f);
  EXPECT_NEAR(nt::edit_similarity("avenve", "avenue"), 5.f / 6.f, 1e-5f);
}

TEST(Similarity, PositionalSimilarityComparesSamePositions) {
  EXPECT_NEAR(nt::positional_similarity("abc", "abd"), 2.f / 3.f, 1e-5f);
  EXPECT_FLOAT_EQ(nt::positional_similarity("abcd", "ab"), 0.5f);
  EXPECT_FLOAT_EQ(nt::positional_similarity("", "abc"), 0.f);
}

TEST(Similarity, CharOverlapIsCaseInsensitive) {
  EXPECT_FLOAT_EQ(nt::char_overlap("Paris", "PARIS"), 1.f);
  EXPECT_FLOAT_EQ(nt::char_overlap("abc", ""), 0.f);
  EXPECT_FLOAT_EQ(nt::char_overlap("ab", "abcd"), 0.5f);
}

TEST(Similarity, ShortKeywordsNeedExactMatch) {
  constexpr std::string_view keywords[] = {"rue"};
  EXPECT_FLOAT_EQ(nt::best_keyword_similarity("rue", keywords), 1.f);
  EXPECT_FLOAT_EQ(nt::best_keyword_similarity("rues", keywords), 0.f);
}

TEST(Similarity, FuzzyStreetKeyword) {
  EXPECT_GE(nt::best_keyword_similarity("avenve", nt::street_types()), 0.8f);
  EXPECT_LT(nt::best_keyword_similarity("banane", nt::street_types()), 0.8f);
}

TEST(Dictionaries, FirstNamesAndCorrections) {
  EXPECT_TRUE(nt::is_common_first_name("jean"));
  EXPECT_FALSE(nt::is_common_first_name("dupont"));
  EXPECT_EQ(nt::ocr_correction("avenve"), "avenue");
  EXPECT_TRUE(nt::ocr_correction("avenue").empty());
}
