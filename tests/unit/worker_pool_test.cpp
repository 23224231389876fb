#include "internal/pipeline/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using resolver::pipeline::ResolveThreadCount;
using resolver::pipeline::WorkerPool;
using resolver::pipeline::WorkQueue;

void TestQueueDrainsThenStops() {
  WorkQueue queue;
  int       ran = 0;
  queue.Enqueue([&] { ++ran; });
  queue.Enqueue([&] { ++ran; });
  queue.Shutdown();

  while (auto task = queue.Dequeue()) (*task)();
  assert(ran == 2);
  assert(!queue.Dequeue().has_value());
}

void TestParallelForVisitsEveryIndexOnce() {
  WorkerPool pool(4);

  std::vector<std::atomic<int>> hits(1000);
  pool.ParallelFor(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });
  for (const auto& hit : hits) assert(hit.load() == 1);

  // the pool is reusable after a barrier
  std::atomic<std::size_t> sum{0};
  pool.ParallelFor(10, [&](std::size_t i) { sum += i; });
  assert(sum.load() == 45);

  pool.ParallelFor(0, [](std::size_t) { assert(false && "no work expected"); });
}

void TestFirstErrorIsRethrownAfterBarrier() {
  WorkerPool       pool(3);
  std::atomic<int> finished{0};

  bool threw = false;
  try {
    pool.ParallelFor(64, [&](std::size_t i) {
      if (i == 17) throw std::runtime_error("bucket 17 failed");
      ++finished;
    });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "bucket 17 failed";
  }
  assert(threw);
  assert(finished.load() < 64);

  // a failed batch does not poison the pool
  std::atomic<int> after{0};
  pool.ParallelFor(8, [&](std::size_t) { ++after; });
  assert(after.load() == 8);
}

void TestThreadCountResolution() {
  assert(ResolveThreadCount(3) == 3);
  assert(ResolveThreadCount(0) >= 1);
  assert(WorkerPool(0).threads() >= 1);

  WorkerPool pool(2);
  pool.Stop();
  pool.Stop();
}

} // namespace

int main() {
  TestQueueDrainsThenStops();
  TestParallelForVisitsEveryIndexOnce();
  TestFirstErrorIsRethrownAfterBarrier();
  TestThreadCountResolution();

  std::cout << "worker_pool_test: pass\n";
  return 0;
}
