#include <labelscan/app/batch_parser.hpp>
#include <gtest/gtest.h>
#include <mutex>
#include <set>

namespace na = labelscan::app;
namespace nc = labelscan::core;
namespace nt = labelscan::text;

namespace {

std::vector<std::string> sample_texts() {
  return {
      "12 rue de la Paix\n75002 Paris",
      "8 rue Victor Hugo\n33000 Bordeaux",
      "SARL DUPONT PLOMBERIE\n5 rue des Lilas\n69003 Lyon",
      "",
  };
}

}  // namespace

TEST(BatchParser, SequentialPreservesOrder) {
  const nt::AddressParser parser;
  std::vector<std::size_t> order;
  std::vector<std::string> postals;
  na::run_parse_batch(parser, sample_texts(), [&](std::size_t i, const nc::ParsedAddress& a) {
    order.push_back(i);
    postals.push_back(a.postal_code);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3}));
  EXPECT_EQ(postals, (std::vector<std::string>{"75002", "33000", "69003", ""}));
}

TEST(BatchParser, ParallelVisitsEveryText) {
  const nt::AddressParser parser;
  const auto texts = sample_texts();
  std::mutex mutex;
  std::set<std::size_t> seen;
  std::vector<std::string> raw(texts.size());
  na::run_parse_batch_parallel(
      parser, texts,
      [&](std::size_t i, const nc::ParsedAddress& a) {
        std::lock_guard lock(mutex);
        seen.insert(i);
        raw[i] = a.raw_text;
      },
      3);
  EXPECT_EQ(seen.size(), texts.size());
  EXPECT_EQ(raw, texts);
}

TEST(BatchParser, EmptyBatch) {
  const nt::AddressParser parser;
  int calls = 0;
  na::run_parse_batch_parallel(parser, {}, [&](std::size_t, const nc::ParsedAddress&) { ++calls; });
  EXPECT_EQ(calls, 0);
}
