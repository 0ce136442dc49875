#include <labelscan/text/line_classifier.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nt = labelscan::text;

TEST(LineClassifier, PhoneLine) {
  const auto c = nt::classify_line("TEL: 0612345678", 3);
  EXPECT_EQ(c.type, nt::LineType::Phone);
  EXPECT_EQ(c.original_index, 3u);
  EXPECT_GE(c.score, 0.9f);
}

TEST(LineClassifier, PostalLineWithCity) {
  const auto c = nt::classify_line("69230 SAINT-GENIS-LAVAL", 0);
  EXPECT_EQ(c.type, nt::LineType::Postal);
  EXPECT_FLOAT_EQ(c.score, 1.f);
}

TEST(LineClassifier, InvalidDepartmentIsNotPostal) {
  EXPECT_FLOAT_EQ(nt::score_line("99000 Nulle Part").postal, 0.f);
  EXPECT_GT(nt::score_line("97400 Saint-Denis").postal, 0.f);
}

TEST(LineClassifier, StreetLine) {
  const auto c = nt::classify_line("20 AVENUE MARECHAL FOCH", 1);
  EXPECT_EQ(c.type, nt::LineType::Street);
  EXPECT_GE(c.score, 0.85f);
}

TEST(LineClassifier, FuzzyStreetKeyword) {
  EXPECT_GT(nt::score_line("12 avenuee des Lilas").street, 0.f);
}

TEST(LineClassifier, TrackingCodeIsNeverStreet) {
  const auto scores = nt::score_line("1069 4001 5857 77");
  EXPECT_FLOAT_EQ(scores.street, 0.f);
  EXPECT_FLOAT_EQ(scores.postal, 0.f);
  EXPECT_NE(nt::classify_line("1069 4001 5857 77", 0).type, nt::LineType::Street);
}

TEST(LineClassifier, NameLine) {
  const auto c = nt::classify_line("Jean Dupont", 0);
  EXPECT_EQ(c.type, nt::LineType::Name);
  EXPECT_GE(c.score, 0.7f);
}

TEST(LineClassifier, AnnexLine) {
  EXPECT_EQ(nt::classify_line("Batiment B", 0).type, nt::LineType::Annex);
}

TEST(LineClassifier, CompanyLine) {
  const auto c = nt::classify_line("SARL DUPONT PLOMBERIE", 0);
  EXPECT_EQ(c.type, nt::LineType::Company);
  EXPECT_FLOAT_EQ(c.score, 0.7f);
}

TEST(LineClassifier, EmptyLineIsUnknown) {
  const auto c = nt::classify_line("", 0);
  EXPECT_EQ(c.type, nt::LineType::Unknown);
  EXPECT_FLOAT_EQ(c.score, 0.f);
}

TEST(LineClassifier, ClassifiesEveryLineInOrder) {
  const std::vector<std::string> lines = {"Jean Dupont", "12 rue de la Paix", "75002 Paris"};
  const auto classes = nt::classify_lines(lines);
  ASSERT_EQ(classes.size(), 3u);
  for (std::size_t i = 0; i < classes.size(); ++i) {
    EXPECT_EQ(classes[i].original_index, i);
    EXPECT_EQ(classes[i].content, lines[i]);
  }
  EXPECT_EQ(classes[1].type, nt::LineType::Street);
  EXPECT_EQ(classes[2].type, nt::LineType::Postal);
  EXPECT_EQ(nt::to_string(classes[2].type), "postal");
}
