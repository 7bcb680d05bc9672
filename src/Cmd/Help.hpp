#pragma once

#include "../Cli.hpp"

namespace jvminspect {

extern const Subcmd HELP_CMD;

} // namespace jvminspect
