#include <labelscan/app/parse_queue.hpp>
#include <labelscan/core/logging.hpp>
#include <exception>
#include <utility>

namespace labelscan::app {

ParseQueue::ParseQueue(QueueConfig config, text::AddressParser parser)
    : config_(config), parser_(parser) {
  worker_ = std::thread([this] { worker_loop(); });
}

ParseQueue::~ParseQueue() {
  std::deque<Job> orphaned;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    orphaned.swap(jobs_);
  }
  cv_.notify_all();
  for (auto& job : orphaned) {
    job.promise.set_value(std::unexpected(core::ParseError::QueueStopped));
  }
  if (worker_.joinable()) worker_.join();
}

ParseFuture ParseQueue::submit(std::string raw_text) {
  std::lock_guard lock(mutex_);
  if (stopping_) {
    std::promise<ParseOutcome> stopped;
    stopped.set_value(std::unexpected(core::ParseError::QueueStopped));
    return stopped.get_future().share();
  }
  if (config_.memoize && last_future_ && raw_text == last_text_) {
    core::logger()->trace("parse queue: duplicate text, reusing previous job");
    return *last_future_;
  }
  Job job{raw_text, {}};
  ParseFuture future = job.promise.get_future().share();
  jobs_.push_back(std::move(job));
  last_text_ = std::move(raw_text);
  last_future_ = future;
  cv_.notify_one();
  return future;
}

std::size_t ParseQueue::cancel_all() {
  std::deque<Job> cancelled;
  {
    std::lock_guard lock(mutex_);
    cancelled.swap(jobs_);
    last_future_.reset();
    last_text_.clear();
  }
  for (auto& job : cancelled) {
    job.promise.set_value(std::unexpected(core::ParseError::Cancelled));
  }
  if (!cancelled.empty()) {
    core::logger()->debug("parse queue: cancelled {} pending jobs", cancelled.size());
  }
  return cancelled.size();
}

std::size_t ParseQueue::pending() const {
  std::lock_guard lock(mutex_);
  return jobs_.size();
}

std::size_t ParseQueue::completed() const {
  std::lock_guard lock(mutex_);
  return completed_;
}

void ParseQueue::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) break;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    std::this_thread::yield();
    ParseOutcome outcome;
    std::exception_ptr failure;
    try {
      outcome = parser_.parse(job.text);
    } catch (const std::exception& e) {
      core::logger()->error("parse queue: job failed: {}", e.what());
      failure = std::current_exception();
    }
    std::this_thread::yield();

    // Counted before the result is visible to waiters.
    {
      std::lock_guard lock(mutex_);
      ++completed_;
    }
    if (failure) {
      job.promise.set_exception(failure);
    } else {
      job.promise.set_value(std::move(outcome));
    }
  }
}

}  // namespace labelscan::app
