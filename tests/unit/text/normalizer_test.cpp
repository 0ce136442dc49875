#include <labelscan/text/normalizer.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nt = labelscan::text;

TEST(Normalizer, FoldsAccentsAndLigatures) {
  EXPECT_EQ(nt::fold_to_ascii("Économie à l’été"), "Economie a l'ete");
  EXPECT_EQ(nt::fold_to_ascii("cœur"), "coeur");
  EXPECT_EQ(nt::fold_to_ascii("plain"), "plain");
}

TEST(Normalizer, DropsMalformedBytes) {
  const std::string bad = std::string("ab") + '\xC3' + "c";
  EXPECT_EQ(nt::fold_to_ascii(bad), "abc");
}

TEST(Normalizer, EmptyInputYieldsNoLines) {
  const auto t = nt::normalize("");
  EXPECT_TRUE(t.lines.empty());
  EXPECT_TRUE(t.flat.empty());
  EXPECT_TRUE(nt::normalize("  \n \r\n ").lines.empty());
}

TEST(Normalizer, UnifiesLineBreaksAndTrims) {
  const auto t = nt::normalize("  ligne   un \r\nligne deux\rligne trois\n\n");
  const std::vector<std::string> expected = {"ligne un", "ligne deux", "ligne trois"};
  EXPECT_EQ(t.lines, expected);
  EXPECT_EQ(t.flat, "ligne un ligne deux ligne trois");
}

TEST(Normalizer, SplitsSlashSeparatedDigitGroups) {
  EXPECT_EQ(nt::normalize("06/12/34").lines.at(0), "06 12 34");
  EXPECT_EQ(nt::normalize("06/12/34/56/78").lines.at(0), "06 12 34 56 78");
}

TEST(Normalizer, CommaSplitsSingleLineInput) {
  const auto t = nt::normalize("12 rue de la Paix, 75002 Paris");
  ASSERT_EQ(t.lines.size(), 2u);
  EXPECT_EQ(t.lines[0], "12 rue de la Paix");
  EXPECT_EQ(t.lines[1], "75002 Paris");
}

TEST(Normalizer, CommaKeptWhenTextHasLines) {
  const auto t = nt::normalize("Dupont, Jean\n75002 Paris");
  ASSERT_EQ(t.lines.size(), 2u);
  EXPECT_EQ(t.lines[0], "Dupont, Jean");
}

TEST(Normalizer, CorrectsOcrMisreadingsKeepingCase) {
  EXPECT_EQ(nt::normalize("20 AVENVE FOCH").lines.at(0), "20 AVENUE FOCH");
  EXPECT_EQ(nt::normalize("20 Avenve Foch").lines.at(0), "20 Avenue Foch");
  EXPECT_EQ(nt::correct_ocr_words("3 chemln du lac"), "3 chemin du lac");
}
