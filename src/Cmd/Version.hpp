#pragma once

#include "../Cli.hpp"

namespace jvminspect {

extern const Subcmd VERSION_CMD;

} // namespace jvminspect
