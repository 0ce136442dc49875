#pragma once

#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/address_parser.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#ifdef LABELSCAN_HAS_TBB

namespace labelscan::app {

/// Callback for each parsed text in the TBB runner; receives the result and the
/// source id of its work item. May be invoked from TBB worker threads; must be thread-safe.
using ParsedAddressCallbackWithSource =
    std::function<void(const core::ParsedAddress&, const std::string& source_id)>;

/// Parses a batch of (source_id, text) work items in parallel using TBB.
///
/// A source id names where the text came from (a device, a log file, a label
/// batch) and is passed back untouched. AddressParser is stateless, so one
/// parser serves every task.
void run_parse_batch_tbb(const text::AddressParser& parser,
                         const std::vector<std::pair<std::string, std::string>>& work_items,
                         ParsedAddressCallbackWithSource callback);

}  // namespace labelscan::app

#endif  // LABELSCAN_HAS_TBB
