#include "Help.hpp"

#include "../Cli.hpp"

#include <rs/result.hpp>

namespace jvminspect {

static rs::Result<void> helpMain(CliArgsView args) noexcept;

const Subcmd HELP_CMD = //
    Subcmd{ "help" }
        .setDesc("Displays help for a jvminspect subcommand")
        .setArg(Arg{ "COMMAND" }.setRequired(false))
        .setMainFn(helpMain);

static rs::Result<void> helpMain(const CliArgsView args) noexcept {
  return getCli().printHelp(args);
}

} // namespace jvminspect
