#pragma once

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

namespace resolver::clustering {

/*
  Union-find over dense indices with path halving and union by size.
*/
class DisjointSet {
 public:
  explicit DisjointSet(std::size_t n) : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
  }

  std::size_t Find(std::size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x          = parent_[x];
    }
    return x;
  }

  bool Union(std::size_t a, std::size_t b) {
    a = Find(a);
    b = Find(b);
    if (a == b) return false;
    if (size_[a] < size_[b]) std::swap(a, b);
    parent_[b] = a;
    size_[a] += size_[b];
    return true;
  }

 private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> size_;
};

} // namespace resolver::clustering
