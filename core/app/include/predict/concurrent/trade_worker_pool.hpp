#pragma once

#include "predict/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// TradeWorkerPool — fixed set of threads running one unit of work per task
// -----------------------------------------------------------------------------
//
// @brief  Executes submitted trade requests concurrently and hands results
//         back through std::future.
//
// @details
// submit() wraps the callable in a std::packaged_task, so a result or an
// exception (TradeError included) travels to whoever waits on the future.
// Workers block on a ThreadSafeQueue; there is no polling.
//
// stop() closes the queue and joins the workers after they finish every
// task already queued. A caller that gave up waiting on a future (request
// timeout) therefore never cuts a commit short.
//
// Thread model:
//   submit() is safe from any thread. start()/stop() belong to the owner.
//
// Ownership:
//   Owned by TradingEngine through std::unique_ptr. Joins in its destructor.
// -----------------------------------------------------------------------------
class TradeWorkerPool {
 public:
  explicit TradeWorkerPool(std::size_t thread_count);

  ~TradeWorkerPool();

  TradeWorkerPool(const TradeWorkerPool&) = delete;
  TradeWorkerPool& operator=(const TradeWorkerPool&) = delete;
  TradeWorkerPool(TradeWorkerPool&&) = delete;
  TradeWorkerPool& operator=(TradeWorkerPool&&) = delete;

  // Spawns the workers. Idempotent. A stopped pool cannot be restarted.
  void start();

  // Drains queued tasks, then joins. Idempotent.
  void stop();

  // Tasks submitted before start() run once the workers exist. Throws
  // std::logic_error after stop().
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>>;

  std::size_t threadCount() const { return thread_count_; }

 private:
  using Task = std::function<void()>;

  void run();

  const std::size_t thread_count_;
  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> workers_;
};

template <typename Fn>
auto TradeWorkerPool::submit(Fn&& fn)
    -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
  using Result = std::invoke_result_t<std::decay_t<Fn>>;

  // std::function needs a copyable target; packaged_task is move-only.
  auto task =
      std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
  std::future<Result> future = task->get_future();

  if (!tasks_.push([task] { (*task)(); })) {
    throw std::logic_error("TradeWorkerPool: pool is stopped");
  }
  return future;
}

}  // namespace predict
