#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <string>
#include <thread>

namespace sg::sys {

// SG_TRACE=1 turns tracing on; read once per process.
inline bool trace_enabled() {
#if defined(SG_TRACE_ALWAYS) && SG_TRACE_ALWAYS
  return true;
#else
  static std::atomic<int> cached{-1};
  int v = cached.load(std::memory_order_relaxed);
  if (v < 0) {
    const char* e = std::getenv("SG_TRACE");
    v = (e && *e && *e != '0') ? 1 : 0;
    cached.store(v, std::memory_order_relaxed);
  }
  return v == 1;
#endif
}

inline std::size_t trace_tid() {
  return std::hash<std::thread::id>{}(std::this_thread::get_id());
}

template <class... Args>
inline void trace_event(const Args&... args) {
  if (!trace_enabled()) return;
  std::ostringstream oss;
  (oss << ... << args);
  std::fprintf(stderr, "[SG_TRACE] %s\n", oss.str().c_str());
  std::fflush(stderr);
}

struct ScopedTimer {
  const char* label;
  bool on;
  std::chrono::steady_clock::time_point t0;

  explicit ScopedTimer(const char* lbl)
    : label(lbl), on(trace_enabled()),
      t0(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    if (!on) return;
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(steady_clock::now() - t0).count();
    std::fprintf(stderr, "[SG_TRACE] %s | %lld us | tid=%zu\n",
                 label ? label : "(unnamed)",
                 static_cast<long long>(us),
                 trace_tid());
    std::fflush(stderr);
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;
};

} // namespace sg::sys

#define SG_CONCAT_SG_TIMER(a,b) SG_CONCAT_SG_TIMER_IMPL(a,b)
#define SG_CONCAT_SG_TIMER_IMPL(a,b) a##b
#define SG_UNIQUE_SG_TIMER SG_CONCAT_SG_TIMER(_sg_timer_, __LINE__)
#define SG_TRACE_SCOPE(label_literal) ::sg::sys::ScopedTimer SG_UNIQUE_SG_TIMER{label_literal}
