#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace resolver::pipeline {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class WorkQueue {
 public:
  void Enqueue(Task task);

  // Blocks until a task is available; nullopt once shut down and drained.
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace resolver::pipeline
