#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace resolver::runtime {

using WorkItem = std::function<void()>;

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class WorkQueue {
 public:
  void Enqueue(WorkItem item);

  // blocking wait; nullopt once shut down and drained
  std::optional<WorkItem> Dequeue();

  void Shutdown();

  // Accepts work again after Shutdown().
  void Reopen();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<WorkItem>    queue_;
  bool                    shutdown_ = false;
};

} // namespace resolver::runtime
