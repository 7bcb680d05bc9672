#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/List.hpp"
#include "Cmd/Show.hpp"
#include "Cmd/Version.hpp"
#include "Diag.hpp"

#include <rs/result.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace jvminspect {

const Cli& getCli() {
  static const Cli cli({ &HELP_CMD, &LIST_CMD, &SHOW_CMD, &VERSION_CMD });
  return cli;
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(const int argc, char* argv[]) noexcept {
  try {
    // Keep stdout for command output only.
    spdlog::set_default_logger(spdlog::stderr_color_mt("jvminspect"));
    Diag::setLevel(Diag::Info);

    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto result = getCli().parseArgs(args);
    if (result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
    return rs::Ok();
  } catch (const spdlog::spdlog_ex& e) {
    Diag::error("failed to set up logging: {}", e.what());
    return rs::Err();
  }
}

} // namespace jvminspect
