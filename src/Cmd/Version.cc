#include "Version.hpp"

#include "../Cli.hpp"
#include "OperatingSystem.hpp"

#include <fmt/core.h>
#include <rs/result.hpp>
#include <string_view>

#ifndef JVMINSPECT_VERSION
#  define JVMINSPECT_VERSION "0.0.0"
#endif

namespace jvminspect {

static rs::Result<void> versionMain(CliArgsView args) noexcept;

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static rs::Result<void> versionMain(const CliArgsView args) noexcept {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(arg);
    }
  }

  fmt::print("jvminspect {}\n", JVMINSPECT_VERSION);
  fmt::print("host: {}\n", OperatingSystem::current());
  return rs::Ok();
}

} // namespace jvminspect
