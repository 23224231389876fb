#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "work_queue.hpp"

namespace resolver::pipeline {

/*
  Fixed set of worker threads draining one WorkQueue.

  ParallelFor() is the only entry point the engine uses: it splits
  [0, count) into contiguous chunks, queues them, and blocks until every
  chunk has finished. The first exception thrown by a chunk is rethrown on
  the calling thread after the barrier.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  void ParallelFor(std::size_t count, const std::function<void(std::size_t)>& body);

  std::size_t threads() const {
    return threads_;
  }

 private:
  void Run();

  std::size_t                threads_;
  std::shared_ptr<WorkQueue> queue_;
  std::vector<std::thread>   workers_;
};

// threads == 0 picks std::thread::hardware_concurrency(), at least 1.
std::size_t ResolveThreadCount(std::size_t threads);

} // namespace resolver::pipeline
