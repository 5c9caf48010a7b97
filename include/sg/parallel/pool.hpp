#pragma once
#include <cstddef>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "sg/parallel/config.hpp"

// Process-wide worker pool behind parallel_for. Workers start on the first
// submit_range(), sized by get_max_threads() at that moment. A task that
// throws drops everything still queued; wait_for_all() rethrows the first
// exception once the running tasks are done.

namespace sg::parallel {

namespace detail {

class WorkerPool {
 public:
  using Body = std::function<void(std::size_t, std::size_t)>;

  WorkerPool() = default;
  ~WorkerPool() { stop(); }
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void submit(std::size_t begin, std::size_t end, Body fn) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (workers_.empty()) start_locked();
      queue_.push_back(Job{std::move(fn), begin, end});
      ++pending_;
    }
    work_cv_.notify_one();
  }

  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this]{ return pending_ == 0; });
    if (error_) {
      std::exception_ptr e = std::exchange(error_, nullptr);
      lk.unlock();
      std::rethrow_exception(e);
    }
  }

 private:
  struct Job {
    Body fn;
    std::size_t begin{0}, end{0};
  };

  void start_locked() {
    const std::size_t n = get_max_threads();
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) workers_.emplace_back([this]{ run(); });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_) t.join();
    workers_.clear();
  }

  void run() {
    NestedParallelGuard nested;   // parallel_for inside a job runs inline
    for (;;) {
      Job job;
      {
        std::unique_lock<std::mutex> lk(mu_);
        work_cv_.wait(lk, [this]{ return stopping_ || !queue_.empty(); });
        if (queue_.empty()) return;
        job = std::move(queue_.front());
        queue_.pop_front();
      }
      std::exception_ptr err;
      try {
        job.fn(job.begin, job.end);
      } catch (...) {
        err = std::current_exception();
      }
      finish(err);
    }
  }

  void finish(std::exception_ptr err) {
    std::lock_guard<std::mutex> lk(mu_);
    if (err && !error_) {
      error_ = std::move(err);
      pending_ -= queue_.size();
      queue_.clear();
    }
    if (--pending_ == 0) idle_cv_.notify_all();
  }

  std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Job> queue_;
  std::vector<std::thread> workers_;
  std::size_t pending_ = 0;      // queued + running
  bool stopping_ = false;
  std::exception_ptr error_;
};

inline WorkerPool& pool() {
  static WorkerPool p;
  return p;
}

} // namespace detail

inline void submit_range(std::size_t begin, std::size_t end,
                         std::function<void(std::size_t, std::size_t)> fn) {
  detail::pool().submit(begin, end, std::move(fn));
}

inline void wait_for_all() {
  detail::pool().wait();
}

} // namespace sg::parallel
