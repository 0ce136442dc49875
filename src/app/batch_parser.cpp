#include <labelscan/app/batch_parser.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace labelscan::app {

void run_parse_batch(const text::AddressParser& parser, const std::vector<std::string>& texts,
                     ParsedAddressCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < texts.size(); ++i) {
    callback(i, parser.parse(texts[i]));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_parse_batch_parallel(const text::AddressParser& parser,
                              const std::vector<std::string>& texts,
                              ParsedAddressCallback callback, std::size_t num_workers) {
  const std::size_t n = texts.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_parse_batch(parser, texts, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::atomic<bool> producer_done{false};

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::unique_lock lock(queue_mutex);
        queue_cv.wait(lock, [&]() { return producer_done.load() || !index_queue.empty(); });
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, parser.parse(texts[idx]));
    }
  };

  producer_done = true;
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  queue_cv.notify_all();

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace labelscan::app
