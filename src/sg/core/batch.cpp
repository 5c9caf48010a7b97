#include "sg/core/batch.hpp"
#include "sg/core/autodiff.hpp"
#include "sg/parallel/parallel_for.hpp"
#include "sg/sys/trace.hpp"

namespace sg {

void backward_batch(const std::vector<Scalar>& roots, double seed) {
  SG_TRACE_SCOPE("backward_batch");
  sys::trace_event("backward_batch: ", roots.size(), " roots, max_threads=",
                   parallel::get_max_threads());

  std::vector<GradSink> sinks(roots.size());
  parallel::parallel_for(roots.size(), /*grain=*/1, [&](std::size_t i0, std::size_t i1) {
    for (std::size_t i = i0; i < i1; ++i) backpropagate_into(roots[i], seed, sinks[i]);
  });

  // serial, ordered reduction keeps the sums independent of the thread count
  for (const auto& s : sinks) s.apply();
}

} // namespace sg
