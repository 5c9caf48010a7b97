#pragma once
// Pool-backed parallel_for (lazy persistent pool, grain-aware, nested-safe)
#include <cstddef>
#include <algorithm>
#include <utility>

#include "sg/parallel/config.hpp"
#include "sg/parallel/pool.hpp"

namespace sg { namespace parallel {

// 1-D parallel_for over [0, n). body(i0, i1) sees disjoint contiguous blocks.
template <class Fn>
inline void parallel_for(std::size_t n, std::size_t grain, Fn&& body) {
  using std::size_t;

  const size_t Tcap = sg::parallel::get_max_threads();
  const size_t T    = std::max<size_t>(1, std::min(Tcap, n));

  // Serial gates (user-forced or nested)
  if (T == 1 || n == 0 || sg::parallel::serial_override()) {
    body(0, n);
    return;
  }

  const size_t chunks = (grain == 0)
      ? T
      : std::max<size_t>(1, std::min(T, (n + grain - 1) / grain));

  if (chunks == 1) {
    body(0, n);
    return;
  }

  auto k_block = [&](size_t k)->std::pair<size_t,size_t> {
    const size_t q = n / chunks, r = n % chunks;
    const size_t lo = k * q + (k < r ? k : r);
    return {lo, lo + q + (k < r)};
  };

  for (size_t k = 0; k < chunks; ++k) {
    auto range = k_block(k);
    sg::parallel::submit_range(range.first, range.second, [&body](std::size_t i0, std::size_t i1){
      if (i1 > i0) body(i0, i1);
    });
  }

  // rethrows the first failing chunk; later chunks may have been skipped
  sg::parallel::wait_for_all();
}

// Overload: grain defaults to 0 (auto)
template <class Fn>
inline void parallel_for(std::size_t n, Fn&& body) {
  parallel_for(n, /*grain=*/0, std::forward<Fn>(body));
}

}} // namespace sg::parallel
