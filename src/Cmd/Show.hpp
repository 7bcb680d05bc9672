#pragma once

#include "../Cli.hpp"

namespace jvminspect {

extern const Subcmd SHOW_CMD;

} // namespace jvminspect
