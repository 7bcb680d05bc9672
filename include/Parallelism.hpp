#pragma once

#include <cstddef>

namespace jvminspect {

void setParallelism(std::size_t numThreads);
std::size_t getParallelism();

} // namespace jvminspect
