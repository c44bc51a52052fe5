#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "internal/runtime/work_queue.hpp"

namespace resolver::runtime {

/*
  Fixed pool of worker threads over a WorkQueue.

  RunAll() is the only entry point the pipeline uses: it enqueues a batch,
  blocks until every task of the batch has finished and then rethrows the
  exception of the lowest-indexed failed task, if any. Tasks write into
  their own result slots; the pool never shares mutable state between
  them.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  void RunAll(std::vector<std::function<void()>> tasks);

  std::size_t Threads() const {
    return thread_count_;
  }

 private:
  void Run();

  std::size_t              thread_count_;
  WorkQueue                queue_;
  std::vector<std::thread> threads_;
  bool                     started_ = false;
};

} // namespace resolver::runtime
