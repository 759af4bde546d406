#include "predict/concurrent/trade_worker_pool.hpp"

#include <iostream>

namespace predict {

TradeWorkerPool::TradeWorkerPool(std::size_t thread_count)
    : thread_count_(thread_count) {
  if (thread_count_ == 0) {
    throw std::invalid_argument("TradeWorkerPool: thread_count must be >= 1");
  }
}

TradeWorkerPool::~TradeWorkerPool() { stop(); }

void TradeWorkerPool::start() {
  if (!workers_.empty()) {
    return;
  }
  if (tasks_.closed()) {
    throw std::logic_error("TradeWorkerPool: cannot restart a stopped pool");
  }

  workers_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    workers_.emplace_back([this] { run(); });
  }
  std::cout << "[TradeWorkerPool] started " << thread_count_
            << " worker(s).\n";
}

void TradeWorkerPool::stop() {
  tasks_.close();

  if (workers_.empty()) {
    return;
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  std::cout << "[TradeWorkerPool] stopped.\n";
}

// Worker loop: returns once the queue is closed and drained. Exceptions
// thrown by a task are captured by its packaged_task.
void TradeWorkerPool::run() {
  while (auto task = tasks_.pop()) {
    (*task)();
  }
}

}  // namespace predict
