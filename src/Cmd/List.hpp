#pragma once

#include "../Cli.hpp"

namespace jvminspect {

extern const Subcmd LIST_CMD;

} // namespace jvminspect
