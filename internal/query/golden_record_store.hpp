#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>

#include "generation.hpp"

namespace resolver::query {

/*
  Holds the published generation.

  Publish() swaps one pointer under an exclusive lock; Current() copies it
  under a shared lock. A reader keeps its copy for the whole call, so it
  sees either the old or the new generation, never a mix.
*/
class GoldenRecordStore {
 public:
  GoldenRecordStore();

  void Publish(std::shared_ptr<const Generation> generation);

  std::shared_ptr<const Generation> Current() const;

  std::uint64_t CurrentNumber() const;

 private:
  mutable std::shared_mutex         mutex_;
  std::shared_ptr<const Generation> current_;
};

} // namespace resolver::query
