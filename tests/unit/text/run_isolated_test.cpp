#include "run_isolated.hpp"
#include <labelscan/text/candidate_selector.hpp>
#include <labelscan/text/field_extractors.hpp>
#include <labelscan/text/line_classifier.hpp>
#include <labelscan/text/normalizer.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace nt = labelscan::text;

TEST(RunIsolated, PassesResultThrough) {
  const auto out = nt::detail::run_isolated("step", [] { return std::vector<int>{1, 2, 3}; });
  EXPECT_EQ(out, (std::vector<int>{1, 2, 3}));
}

TEST(RunIsolated, ThrowingStepYieldsEmptyResult) {
  std::vector<int> out{7};
  EXPECT_NO_THROW(out = nt::detail::run_isolated("step", []() -> std::vector<int> {
                    throw std::runtime_error("regex too complex");
                  }));
  EXPECT_TRUE(out.empty());
}

TEST(RunIsolated, FailedExtractorLeavesOtherFieldsFilled) {
  const std::string raw = "Jean Dupont\n12 rue de la Paix\n75002 Paris\n0612345678";
  const auto text = nt::normalize(raw);
  const auto classes = nt::classify_lines(text.lines);
  const nt::ExtractionInput in{text, classes};

  nt::FieldCandidates candidates;
  candidates.phones = nt::detail::run_isolated("phone extraction", []() -> nt::StringCandidates {
    throw std::runtime_error("regex too complex");
  });
  candidates.postal_cities =
      nt::detail::run_isolated("postal extraction", [&] { return nt::extract_postal_cities(in); });
  candidates.streets =
      nt::detail::run_isolated("street extraction", [&] { return nt::extract_streets(in); });
  candidates.names =
      nt::detail::run_isolated("name extraction", [&] { return nt::extract_names(in); });

  EXPECT_TRUE(candidates.phones.empty());
  const auto a = nt::select_fields(candidates, raw);
  EXPECT_TRUE(a.phone_number.empty());
  EXPECT_EQ(a.street, "12 rue de la Paix");
  EXPECT_EQ(a.postal_code, "75002");
  EXPECT_EQ(a.city, "Paris");
  EXPECT_EQ(a.first_name, "Jean");
  EXPECT_GT(a.confidence, 0.f);
}
