#include <labelscan/app/batch_parser_tbb.hpp>
#include <gtest/gtest.h>

#ifdef LABELSCAN_HAS_TBB

#include <map>
#include <mutex>

namespace na = labelscan::app;
namespace nc = labelscan::core;
namespace nt = labelscan::text;

TEST(BatchParserTbb, ReturnsSourceIds) {
  const nt::AddressParser parser;
  const std::vector<std::pair<std::string, std::string>> items = {
      {"scanner-1", "12 rue de la Paix\n75002 Paris"},
      {"scanner-2", "8 rue Victor Hugo\n33000 Bordeaux"},
      {"scanner-3", "garbage"},
  };
  std::mutex mutex;
  std::map<std::string, std::string> postal_by_source;
  na::run_parse_batch_tbb(parser, items,
                          [&](const nc::ParsedAddress& a, const std::string& source_id) {
                            std::lock_guard lock(mutex);
                            postal_by_source[source_id] = a.postal_code;
                          });
  ASSERT_EQ(postal_by_source.size(), 3u);
  EXPECT_EQ(postal_by_source["scanner-1"], "75002");
  EXPECT_EQ(postal_by_source["scanner-2"], "33000");
  EXPECT_EQ(postal_by_source["scanner-3"], "");
}

#endif  // LABELSCAN_HAS_TBB
