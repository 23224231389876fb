#include "worker_pool.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace resolver::pipeline {

namespace {

// Chunks per thread; keeps large buckets from serializing the tail.
constexpr std::size_t kChunksPerThread = 4;

struct Barrier {
  std::mutex              mutex;
  std::condition_variable cv;
  std::size_t             pending = 0;
  std::exception_ptr      error;
};

} // namespace

std::size_t ResolveThreadCount(std::size_t threads) {
  if (threads > 0) {
    return threads;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

WorkerPool::WorkerPool(std::size_t threads) : threads_(ResolveThreadCount(threads)), queue_(std::make_shared<WorkQueue>()) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (!workers_.empty()) {
    return;
  }

  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this);
  }
  RESOLVER_LOG_DEBUG("Worker pool started", {observability::IntField("threads", static_cast<int64_t>(threads_))});
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

void WorkerPool::Run() {
  while (auto task = queue_->Dequeue()) {
    (*task)();
  }
}

void WorkerPool::ParallelFor(std::size_t count, const std::function<void(std::size_t)>& body) {
  if (count == 0) {
    return;
  }
  Start();

  const std::size_t chunks     = std::min(count, threads_ * kChunksPerThread);
  const std::size_t chunk_size = (count + chunks - 1) / chunks;

  auto barrier = std::make_shared<Barrier>();
  barrier->pending = (count + chunk_size - 1) / chunk_size;

  for (std::size_t begin = 0; begin < count; begin += chunk_size) {
    const std::size_t end = std::min(count, begin + chunk_size);
    queue_->Enqueue([barrier, &body, begin, end] {
      std::exception_ptr error;
      try {
        for (std::size_t i = begin; i < end; ++i) {
          body(i);
        }
      } catch (...) {
        error = std::current_exception();
      }

      std::lock_guard lock(barrier->mutex);
      if (error && !barrier->error) {
        barrier->error = error;
      }
      if (--barrier->pending == 0) {
        barrier->cv.notify_all();
      }
    });
  }

  std::unique_lock lock(barrier->mutex);
  barrier->cv.wait(lock, [&] { return barrier->pending == 0; });
  if (barrier->error) {
    std::rethrow_exception(barrier->error);
  }
}

} // namespace resolver::pipeline
