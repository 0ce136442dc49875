#pragma once

#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/address_parser.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace labelscan::app {

/// Callback for each parsed text, with its index in the input batch.
/// Must be thread-safe if using run_parse_batch_parallel.
using ParsedAddressCallback = std::function<void(std::size_t index, const core::ParsedAddress&)>;

/// Parses texts sequentially; calls callback for each result in input order.
void run_parse_batch(const text::AddressParser& parser, const std::vector<std::string>& texts,
                     ParsedAddressCallback callback);

/// Parses texts on a pool of worker threads. The callback may be invoked from
/// any worker, in any order. num_workers 0 = use hardware concurrency.
void run_parse_batch_parallel(const text::AddressParser& parser,
                              const std::vector<std::string>& texts,
                              ParsedAddressCallback callback, std::size_t num_workers = 0);

}  // namespace labelscan::app
