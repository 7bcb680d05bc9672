#include "List.hpp"

#include "../Cli.hpp"
#include "Diag.hpp"
#include "Inventory.hpp"
#include "Parallelism.hpp"
#include "Report.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fmt/core.h>
#include <optional>
#include <rs/result.hpp>
#include <string_view>
#include <system_error>

namespace jvminspect {

namespace fs = std::filesystem;

static rs::Result<void> listMain(CliArgsView args);

const Subcmd LIST_CMD = //
    Subcmd{ "list" }
        .setDesc("Classify the installations recorded in jvms.toml")
        .addOpt(Opt{ "--file" }
                    .setShort("-f")
                    .setDesc("Read installations from the given inventory")
                    .setPlaceholder("<PATH>"))
        .addOpt(optJson())
        .addOpt(optJobs())
        .setMainFn(listMain);

static rs::Result<void> listMain(const CliArgsView args) {
  // Parse args
  std::optional<fs::path> inventoryPath;
  bool json = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "list"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (matchesAny(arg, { "-f", "--file" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      inventoryPath = *++itr;
    } else if (arg == "--json") {
      json = true;
    } else if (matchesAny(arg, { "-j", "--jobs" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      const std::string_view nextArg = *++itr;

      std::uint64_t numThreads{};
      auto [ptr, ec] = std::from_chars(
          nextArg.data(), nextArg.data() + nextArg.size(), numThreads);
      rs_ensure(ec == std::errc() && ptr == nextArg.data() + nextArg.size()
                    && numThreads > 0,
                "invalid number of threads: {}", nextArg);
      setParallelism(numThreads);
    } else {
      return LIST_CMD.noSuchArg(arg);
    }
  }

  if (inventoryPath.has_value()) {
    std::error_code ec;
    const bool exists = fs::exists(*inventoryPath, ec);
    rs_ensure(!ec, "cannot access inventory `{}`: {}", inventoryPath->string(),
              ec.message());
    rs_ensure(exists, "inventory `{}` does not exist", inventoryPath->string());
  }
  const Inventory inventory =
      rs_try(inventoryPath.has_value()
                 ? Inventory::tryParse(*inventoryPath, /*findParents=*/false)
                 : Inventory::tryParse());

  if (inventory.installations.empty()) {
    Diag::warn("no installations listed in {}", inventory.path.string());
  }

  probeCapabilities(inventory.installations);
  if (json) {
    fmt::print("{}\n", toJson(inventory.installations).dump(2));
  } else {
    for (const JvmInstallationMetadata& metadata : inventory.installations) {
      fmt::print("{}\n", toText(metadata));
    }
  }

  const std::size_t numInstallations = inventory.installations.size();
  Diag::info("Inspected", "{} installation{} ({} invalid)", numInstallations,
             numInstallations == 1 ? "" : "s", inventory.numInvalid());
  return rs::Ok();
}

} // namespace jvminspect
