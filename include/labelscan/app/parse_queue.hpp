#pragma once

#include <labelscan/app/config.hpp>
#include <labelscan/core/error.hpp>
#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/address_parser.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace labelscan::app {

using ParseOutcome = std::expected<core::ParsedAddress, core::ParseError>;
using ParseFuture = std::shared_future<ParseOutcome>;

/// Single-worker job queue that keeps text extraction off the frame path.
///
/// submit() never blocks on parsing. Jobs run one at a time in submission
/// order; the worker yields before and after each parse. With memoization on,
/// resubmitting the text of the last accepted job returns that job's future.
class ParseQueue {
 public:
  explicit ParseQueue(QueueConfig config = {}, text::AddressParser parser = {});
  /// Stops the worker after the running job; queued jobs resolve to QueueStopped.
  ~ParseQueue();

  ParseQueue(const ParseQueue&) = delete;
  ParseQueue& operator=(const ParseQueue&) = delete;

  [[nodiscard]] ParseFuture submit(std::string raw_text);

  /// Resolves every queued job to Cancelled without waiting for the running one.
  /// Returns the number of jobs cancelled.
  std::size_t cancel_all();

  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t completed() const;

 private:
  struct Job {
    std::string text;
    std::promise<ParseOutcome> promise;
  };

  void worker_loop();

  QueueConfig config_;
  text::AddressParser parser_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stopping_{false};
  std::size_t completed_{0};
  std::string last_text_;
  std::optional<ParseFuture> last_future_;
  std::thread worker_;
};

}  // namespace labelscan::app
