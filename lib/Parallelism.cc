#include "Parallelism.hpp"

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <tbb/global_control.h>

namespace jvminspect {

static std::unique_ptr<tbb::global_control>& parallelismControl() {
  static std::unique_ptr<tbb::global_control> control;
  return control;
}

void setParallelism(const std::size_t numThreads) {
  spdlog::debug("Limiting parallelism to {} thread(s)", numThreads);
  parallelismControl() = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism, numThreads);
}

std::size_t getParallelism() {
  return tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism);
}

} // namespace jvminspect
