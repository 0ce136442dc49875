#include <labelscan/app/batch_parser_tbb.hpp>

#ifdef LABELSCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace labelscan::app {

void run_parse_batch_tbb(const text::AddressParser& parser,
                         const std::vector<std::pair<std::string, std::string>>& work_items,
                         ParsedAddressCallbackWithSource callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&parser, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const auto& [source_id, text] = work_items[i];
          callback(parser.parse(text), source_id);
        }
      });
}

}  // namespace labelscan::app

#endif  // LABELSCAN_HAS_TBB
