// tests/test_parallel.cpp
#include "test_framework.hpp"
#include "sg/parallel/parallel_for.hpp"
#include "sg/parallel/config.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using sg::parallel::parallel_for;
using sg::parallel::set_max_threads;
using sg::parallel::get_max_threads;
using sg::parallel::ScopedSerial;

// Helper: verify that every index in [0,n) is touched exactly once
static bool all_marked_once(const std::vector<int>& marks) {
  for (size_t i = 0; i < marks.size(); ++i)
    if (marks[i] != 1) return false;
  return true;
}

TEST("parallel/basic_cover_no_overlap") {
  const std::size_t n = 10000;
  set_max_threads(8);
  std::vector<int> marks(n, 0);

  parallel_for(n, /*grain=*/128, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) marks[i] += 1;
  });

  ASSERT_TRUE(all_marked_once(marks));
}

TEST("parallel/single_chunk_when_grain_exceeds_n") {
  const std::size_t n = 100;
  set_max_threads(8);
  std::size_t calls = 0;
  std::size_t got0 = 999, got1 = 999;

  parallel_for(n, /*grain=*/1000, [&](std::size_t i0, std::size_t i1){
    ++calls; got0 = i0; got1 = i1;
  });

  ASSERT_TRUE(calls == 1);
  ASSERT_TRUE(got0 == 0 && got1 == n);
}

TEST("parallel/chunks_capped_by_max_threads") {
  set_max_threads(3);
  std::atomic<std::size_t> chunks{0};

  parallel_for(1000, /*grain=*/100, [&](std::size_t, std::size_t){ ++chunks; });

  // ceil(1000/100) = 10, min(3, 10) = 3
  ASSERT_TRUE(chunks.load() == 3);
}

TEST("parallel/grain_one_gives_one_chunk_per_thread") {
  set_max_threads(4);
  std::atomic<std::size_t> chunks{0};
  std::atomic<std::size_t> covered{0};

  parallel_for(10, /*grain=*/1, [&](std::size_t i0, std::size_t i1){
    ++chunks;
    covered += i1 - i0;
  });

  ASSERT_TRUE(chunks.load() == 4);
  ASSERT_TRUE(covered.load() == 10);
}

TEST("parallel/nested_stays_single_thread_inside") {
  const std::size_t n = 4096;
  set_max_threads(8);
  std::vector<int> marks(n, 0);

  parallel_for(n, /*grain=*/256, [&](std::size_t i0, std::size_t i1){
    std::size_t inner_calls = 0;
    parallel_for(i1 - i0, /*grain=*/64, [&](std::size_t j0, std::size_t j1){
      ++inner_calls;
      for (std::size_t j = j0; j < j1; ++j) marks[i0 + j] += 1;
    });
    if (inner_calls != 1) throw std::runtime_error("nested parallel_for was split");
  });

  ASSERT_TRUE(all_marked_once(marks));
}

TEST("parallel/scoped_serial_forces_single_call") {
  set_max_threads(8);
  std::size_t calls = 0;
  {
    ScopedSerial s;
    parallel_for(20000, /*grain=*/64, [&](std::size_t, std::size_t){ ++calls; });
  }
  ASSERT_TRUE(calls == 1);
}

TEST("parallel/max_threads_one_is_serial") {
  set_max_threads(1);
  std::size_t calls = 0;
  parallel_for(10000, /*grain=*/64, [&](std::size_t, std::size_t){ ++calls; });
  ASSERT_TRUE(calls == 1);
}

TEST("parallel/set_max_threads_clamps_zero") {
  set_max_threads(0);
  ASSERT_TRUE(get_max_threads() == 1);
  set_max_threads(4);
  ASSERT_TRUE(get_max_threads() == 4);
}

TEST("parallel/threads_env_parsing") {
  using sg::parallel::_parse_threads_env;
  ASSERT_TRUE(_parse_threads_env(nullptr, 7) == 7);
  ASSERT_TRUE(_parse_threads_env("", 7) == 7);
  ASSERT_TRUE(_parse_threads_env("3", 7) == 3);
  ASSERT_TRUE(_parse_threads_env("0", 7) == 1);
  ASSERT_TRUE(_parse_threads_env("4x", 7) == 7);
  ASSERT_TRUE(_parse_threads_env("-2", 7) == 7);
}

TEST("parallel/threads_env_overflow_keeps_fallback") {
  using sg::parallel::_parse_threads_env;
  using sg::parallel::kMaxThreads;
  // 2^64 + 4 would wrap to 4 with naive digit accumulation
  ASSERT_TRUE(_parse_threads_env("18446744073709551620", 7) == 7);
  ASSERT_TRUE(_parse_threads_env("99999999999999999999999999", 7) == 7);
  ASSERT_TRUE(_parse_threads_env("1025", 7) == 7);
  ASSERT_TRUE(_parse_threads_env("1024", 7) == kMaxThreads);
}

TEST("parallel/exception_propagates_from_body") {
  set_max_threads(4);
  ASSERT_THROWS_AS(parallel_for(1000, /*grain=*/10, [&](std::size_t i0, std::size_t){
    if (i0 == 0) throw std::runtime_error("boom");
  }), std::runtime_error);

  // pool is still usable
  std::vector<int> marks(1000, 0);
  parallel_for(1000, /*grain=*/10, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) marks[i] += 1;
  });
  ASSERT_TRUE(all_marked_once(marks));
}
