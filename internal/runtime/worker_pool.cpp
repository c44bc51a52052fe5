#include "internal/runtime/worker_pool.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace resolver::runtime {

namespace {

struct Batch {
  std::mutex                      mutex;
  std::condition_variable         done;
  std::size_t                     remaining = 0;
  std::vector<std::exception_ptr> errors;
};

} // namespace

WorkerPool::WorkerPool(std::size_t threads) : thread_count_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (started_) return;
  started_ = true;
  queue_.Reopen();
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  if (!started_) return;
  queue_.Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  started_ = false;
}

void WorkerPool::Run() {
  while (true) {
    auto item = queue_.Dequeue();
    if (!item) break;

    try {
      (*item)();
    } catch (const std::exception& e) {
      RESOLVER_LOG_ERROR("worker task failed", {observability::StringField("error", e.what())});
    }
  }
}

void WorkerPool::RunAll(std::vector<std::function<void()>> tasks) {
  if (tasks.empty()) return;
  Start();

  auto batch       = std::make_shared<Batch>();
  batch->remaining = tasks.size();
  batch->errors.resize(tasks.size());

  for (std::size_t i = 0; i < tasks.size(); ++i) {
    queue_.Enqueue([batch, i, task = std::move(tasks[i])] {
      std::exception_ptr error;
      try {
        task();
      } catch (...) {
        // carried back to RunAll and rethrown there
        error = std::current_exception();
      }

      std::lock_guard lock(batch->mutex);
      batch->errors[i] = error;
      if (--batch->remaining == 0) batch->done.notify_all();
    });
  }

  std::unique_lock lock(batch->mutex);
  batch->done.wait(lock, [&] { return batch->remaining == 0; });

  for (const auto& error : batch->errors) {
    if (error) std::rethrow_exception(error);
  }
}

} // namespace resolver::runtime
