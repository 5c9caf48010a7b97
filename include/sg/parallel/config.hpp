#pragma once
#include <atomic>
#include <cstddef>
#include <cerrno>
#include <cstdlib>
#include <thread>
#include <algorithm>

namespace sg { namespace parallel {

// Upper bound accepted from SG_THREADS.
inline constexpr std::size_t kMaxThreads = 1024;

// ---------- Thread cap ----------
// Global max-threads knob: env SG_THREADS, else hardware_concurrency().
// Tests call set_max_threads(...); callers read get_max_threads().
// Digits only; anything else, or a value that overflows, keeps the fallback.
inline std::size_t _parse_threads_env(const char* env, std::size_t fallback) {
  if (!env || *env < '0' || *env > '9') return fallback;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(env, &end, 10);
  if (errno == ERANGE || *end != '\0' || v > kMaxThreads) return fallback;
  return v == 0 ? 1 : static_cast<std::size_t>(v);
}

inline std::atomic<std::size_t>& _threads_cap() {
  static std::atomic<std::size_t> cap{[]{
    const unsigned hc = std::thread::hardware_concurrency();
    const std::size_t hw = std::max<std::size_t>(1, hc ? hc : 4);
    return _parse_threads_env(std::getenv("SG_THREADS"), hw);
  }()};
  return cap;
}
inline void set_max_threads(std::size_t n) {
  if (n == 0) n = 1;
  _threads_cap().store(n, std::memory_order_relaxed);
}
inline std::size_t get_max_threads() {
  return _threads_cap().load(std::memory_order_relaxed);
}

// ---------- ScopedSerial (TLS depth) ----------
struct ScopedSerial {
  ScopedSerial(){ ++depth_ref(); }
  ~ScopedSerial(){ --depth_ref(); }
  ScopedSerial(const ScopedSerial&) = delete;
  ScopedSerial& operator=(const ScopedSerial&) = delete;
  static int depth(){ return depth_ref(); }
private:
  static  int& depth_ref(){ static thread_local int d = 0; return d; }
};

// ---------- Nested guard (set on pool workers) ----------
inline bool& nesting_flag() { static thread_local bool f = false; return f; }
struct NestedParallelGuard {
  NestedParallelGuard() : prev_(nesting_flag()) { nesting_flag() = true; }
  ~NestedParallelGuard(){ nesting_flag() = prev_; }
  NestedParallelGuard(const NestedParallelGuard&) = delete;
  NestedParallelGuard& operator=(const NestedParallelGuard&) = delete;
  static bool active(){ return nesting_flag(); }
private:
  bool prev_;
};

// ---------- Unified serial gate ----------
inline bool serial_override() {
  return ScopedSerial::depth() > 0
      || nesting_flag()
      || get_max_threads() <= 1;
}

}} // namespace sg::parallel
