#include <labelscan/text/address_parser.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nt = labelscan::text;
namespace nc = labelscan::core;

TEST(AddressParser, PrintedLabelExample) {
  const nt::AddressParser parser;
  const auto a = parser.parse(
      "JEAN DUPONT\n20 AVENUE MARECHAL FOCH\n69230 SAINT-GENIS-LAVAL\nTEL: 0612345678");
  EXPECT_EQ(a.street, "20 Avenue Marechal Foch");
  EXPECT_EQ(a.postal_code, "69230");
  EXPECT_EQ(a.city, "Saint-Genis-Laval");
  EXPECT_EQ(a.phone_number, "+33612345678");
  EXPECT_EQ(a.first_name, "Jean");
  EXPECT_EQ(a.last_name, "Dupont");
  EXPECT_FALSE(a.is_company);
  EXPECT_GE(a.confidence, 0.9f);
  EXPECT_LE(a.confidence, 1.f);
  EXPECT_EQ(a.full_address, "20 Avenue Marechal Foch, 69230 Saint-Genis-Laval");
}

TEST(AddressParser, SyntheticLabelRoundTrip) {
  const nt::AddressParser parser;
  const auto a = parser.parse("12 rue de la Paix\n75002 Paris\n0612345678");
  EXPECT_EQ(a.street, "12 rue de la Paix");
  EXPECT_EQ(a.postal_code, "75002");
  EXPECT_EQ(a.city, "Paris");
  EXPECT_EQ(a.phone_number, "+33612345678");
  EXPECT_GE(a.confidence, 0.7f);
  EXPECT_TRUE(nc::is_addressable(a));
}

TEST(AddressParser, TrackingCodeNotSelectedAsStreet) {
  const nt::AddressParser parser;
  const auto a =
      parser.parse("COLISSIMO\n1069 4001 5857 77\n12 rue de la Paix\n75002 Paris\n0612345678");
  EXPECT_EQ(a.street, "12 rue de la Paix");
  EXPECT_EQ(a.street.find("4001"), std::string::npos);
  EXPECT_EQ(a.phone_number, "+33612345678");
}

TEST(AddressParser, RunOnLineWithCarrierKeepsPhone) {
  const nt::AddressParser parser;
  const auto a = parser.parse("Chronopost XY123456789FR 12 rue de la Paix 75002 Paris 0612345678");
  EXPECT_EQ(a.phone_number, "+33612345678");
  EXPECT_EQ(a.postal_code, "75002");
  EXPECT_EQ(a.city, "Paris");
}

TEST(AddressParser, CivilityNameAndAnnex) {
  const nt::AddressParser parser;
  const auto a = parser.parse("M. Jean Martin\nBatiment B\n8 rue Victor Hugo\n33000 Bordeaux");
  EXPECT_EQ(a.first_name, "Jean");
  EXPECT_EQ(a.last_name, "Martin");
  EXPECT_EQ(a.address_annex, "Batiment B");
  EXPECT_EQ(a.street, "8 rue Victor Hugo");
  EXPECT_EQ(a.full_address, "8 rue Victor Hugo, Batiment B, 33000 Bordeaux");
  EXPECT_GE(a.confidence, 0.7f);
}

TEST(AddressParser, CompanyRecipient) {
  const nt::AddressParser parser;
  const auto a = parser.parse("SARL DUPONT PLOMBERIE\n5 rue des Lilas\n69003 Lyon");
  EXPECT_TRUE(a.is_company);
  EXPECT_EQ(a.company_name, "SARL DUPONT PLOMBERIE");
  EXPECT_TRUE(a.first_name.empty());
  EXPECT_EQ(a.street, "5 rue des Lilas");
  EXPECT_EQ(a.postal_code, "69003");
  EXPECT_EQ(a.city, "Lyon");
}

TEST(AddressParser, SingleLineCommaSeparated) {
  const nt::AddressParser parser;
  const auto a = parser.parse("12 rue de la Paix, 75002 Paris");
  EXPECT_EQ(a.street, "12 rue de la Paix");
  EXPECT_EQ(a.postal_code, "75002");
  EXPECT_EQ(a.city, "Paris");
}

TEST(AddressParser, EmptyInputYieldsEmptyRecord) {
  const nt::AddressParser parser;
  const auto a = parser.parse("");
  EXPECT_EQ(a, nc::ParsedAddress{});
  EXPECT_FLOAT_EQ(a.confidence, 0.f);
}

TEST(AddressParser, GarbageNeverThrows) {
  const nt::AddressParser parser;
  const std::vector<std::string> inputs = {
      "%%%%", "\n\n\n", "////", "+33", "1 2 3 4 5 6 7 8 9", std::string(2000, '7'),
      std::string("\xFF\xFE\xC3", 3)};
  for (const std::string& input : inputs) {
    nc::ParsedAddress a;
    EXPECT_NO_THROW(a = parser.parse(input));
    EXPECT_GE(a.confidence, 0.f);
    EXPECT_LE(a.confidence, 1.f);
    EXPECT_EQ(a.raw_text, input);
  }
}

TEST(AddressParser, Idempotent) {
  const nt::AddressParser parser;
  const std::string text = "Mme Sophie Durand\nappt 12\n3 impasse des Roses\n13008 Marseille";
  EXPECT_EQ(parser.parse(text), parser.parse(text));
}

TEST(AddressParser, ResultsSimilar) {
  const nt::AddressParser parser;
  const auto a = parser.parse("12 rue de la Paix\n75002 Paris\n0612345678");
  const auto b = parser.parse("12 rue de la Paix\n75002 PARIS\n0612345678");
  const auto c = parser.parse("12 rue de la Paix\n75002 Paris\n0712345678");
  EXPECT_TRUE(nt::results_similar(a, b));
  EXPECT_FALSE(nt::results_similar(a, c));
  EXPECT_FALSE(nt::results_similar(a, nc::ParsedAddress{}));
}
