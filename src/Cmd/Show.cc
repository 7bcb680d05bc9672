#include "Show.hpp"

#include "../Cli.hpp"
#include "Inspection/JvmInstallationMetadata.hpp"
#include "JavaVersion.hpp"
#include "Report.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jvminspect {

namespace fs = std::filesystem;

static rs::Result<void> showMain(CliArgsView args);

const Subcmd SHOW_CMD = //
    Subcmd{ "show" }
        .setDesc("Classify a single installation from its probed facts")
        .addOpt(Opt{ "--version" }
                    .setDesc("Language version, e.g. 17.0.8")
                    .setPlaceholder("<VERSION>"))
        .addOpt(Opt{ "--vendor" }
                    .setDesc("Vendor reported by the runtime")
                    .setPlaceholder("<VENDOR>"))
        .addOpt(Opt{ "--implementation" }
                    .setDesc("VM implementation name")
                    .setPlaceholder("<NAME>"))
        .addOpt(Opt{ "--error" }
                    .setDesc("Record a failed probe with this message")
                    .setPlaceholder("<MESSAGE>"))
        .addOpt(optJson())
        .setArg(Arg{ "HOME" }.setDesc("Installation directory"))
        .setMainFn(showMain);

static void printField(const std::string_view key,
                       const std::string_view value) {
  fmt::print("{:<16}{}\n", fmt::format("{}:", key), value);
}

static void printText(const JvmInstallationMetadata& metadata) {
  printField("Display name", metadata.getDisplayName());
  printField("Java home", metadata.getJavaHome().string());
  if (!metadata.isValidInstallation()) {
    printField("Error", metadata.getErrorMessage());
    return;
  }

  const JvmVendor vendor = metadata.getVendor();
  printField("Version", metadata.getLanguageVersion().toString());
  printField("Vendor", fmt::format("{} ({})", vendor.getRawVendor(),
                                   vendor.getKnownVendor()));
  printField("Implementation", metadata.getImplementationName());

  const JavaInstallationCapabilities& capabilities =
      metadata.getCapabilities();
  printField("Capabilities", capabilities.empty()
                                 ? "none"
                                 : fmt::format("{}", fmt::join(capabilities,
                                                               ", ")));
}

static rs::Result<void> showMain(const CliArgsView args) {
  // Parse args
  std::optional<std::string> home;
  std::optional<std::string> version;
  std::optional<std::string> vendor;
  std::optional<std::string> implementation;
  std::optional<std::string> errorMessage;
  bool json = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "show"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--json") {
      json = true;
    } else if (matchesAny(arg, { "--version", "--vendor", "--implementation",
                                 "--error" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      std::string value = *++itr;
      if (arg == "--version") {
        version = std::move(value);
      } else if (arg == "--vendor") {
        vendor = std::move(value);
      } else if (arg == "--implementation") {
        implementation = std::move(value);
      } else {
        errorMessage = std::move(value);
      }
    } else if (!home.has_value() && !arg.starts_with('-')) {
      home = arg;
    } else {
      return SHOW_CMD.noSuchArg(arg);
    }
  }

  rs_ensure(home.has_value() && !home->empty(),
            "the following required argument was not provided: <HOME>");

  std::error_code ec;
  fs::path javaHome = fs::absolute(*home, ec);
  if (ec) {
    spdlog::debug("Keeping `{}` as given: {}", *home, ec.message());
    javaHome = *home;
  }

  std::optional<JvmInstallationMetadata> metadata;
  if (errorMessage.has_value()) {
    rs_ensure(!version.has_value() && !vendor.has_value()
                  && !implementation.has_value(),
              "`--error` cannot be used with `--version`, `--vendor`, or "
              "`--implementation`");
    metadata.emplace(JvmInstallationMetadata::failure(
        std::move(javaHome), std::move(*errorMessage)));
  } else {
    rs_ensure(version.has_value(),
              "the following required argument was not provided: "
              "--version <VERSION>");
    rs_ensure(vendor.has_value(),
              "the following required argument was not provided: "
              "--vendor <VENDOR>");
    const JavaVersion languageVersion = rs_try(JavaVersion::parse(*version));
    metadata.emplace(JvmInstallationMetadata::from(
        std::move(javaHome), languageVersion, std::move(*vendor),
        implementation.value_or("")));
  }

  if (json) {
    fmt::print("{}\n", toJson(*metadata).dump(2));
  } else {
    printText(*metadata);
  }
  return rs::Ok();
}

} // namespace jvminspect
