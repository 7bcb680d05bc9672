#include "Cli.hpp"

#include "Diag.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/core.h>
#include <initializer_list>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef JVMINSPECT_VERSION
#  define JVMINSPECT_VERSION "0.0.0"
#endif

namespace jvminspect {

static constexpr std::size_t HELP_INDENT = 24;

bool matchesAny(const std::string_view arg,
                const std::initializer_list<std::string_view> patterns) noexcept {
  return std::ranges::find(patterns, arg) != patterns.end();
}

Opt& Opt::setShort(const std::string_view shortName) noexcept {
  this->shortName = shortName;
  return *this;
}

Opt& Opt::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Opt& Opt::setPlaceholder(const std::string_view placeholder) noexcept {
  this->placeholder = placeholder;
  return *this;
}

std::string Opt::usage() const {
  std::string res = shortName.empty() ? "    " : fmt::format("{}, ", shortName);
  res += name;
  if (!placeholder.empty()) {
    res += ' ';
    res += placeholder;
  }
  return res;
}

Arg& Arg::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Arg& Arg::setRequired(const bool required) noexcept {
  this->required = required;
  return *this;
}

std::string Arg::usage() const {
  return required ? fmt::format("<{}>", name) : fmt::format("[{}]", name);
}

Subcmd& Subcmd::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}

Subcmd& Subcmd::addOpt(Opt opt) {
  opts.emplace_back(std::move(opt));
  return *this;
}

Subcmd& Subcmd::setArg(Arg arg) {
  this->arg = std::move(arg);
  return *this;
}

Subcmd& Subcmd::setMainFn(MainFn* mainFn) noexcept {
  this->mainFn = mainFn;
  return *this;
}

rs::Result<void> Subcmd::run(const CliArgsView args) const {
  rs_ensure(mainFn != nullptr, "subcommand `{}` has no main function", name);
  spdlog::debug("Running subcommand `{}` with {} argument(s)", name,
                args.size());
  return mainFn(args);
}

static void printOptLine(const std::string_view usage,
                         const std::string_view desc) {
  fmt::print("  {:<{}}{}\n", usage, HELP_INDENT, desc);
}

static void printGlobalOpts() {
  printOptLine("-h, --help", "Print help");
  printOptLine("-v, --verbose", "Use verbose output (-vv very verbose output)");
  printOptLine("-q, --quiet", "Do not print jvminspect status messages");
  printOptLine("    --color <WHEN>", "Coloring: auto, always, never");
}

void Subcmd::printHelp() const {
  fmt::print("{}\n\n", desc);
  fmt::print("Usage: jvminspect {} [OPTIONS]{}\n\n", name,
             arg.has_value() ? " " + arg->usage() : "");
  fmt::print("Options:\n");
  printGlobalOpts();
  for (const Opt& opt : opts) {
    printOptLine(opt.usage(), opt.getDesc());
  }
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument '{}' found\n\n"
          "For more information, try 'jvminspect help {}'",
          arg, name);
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("Missing argument for `{}`", arg);
}

const Opt& optJson() {
  static const Opt opt =
      Opt{ "--json" }.setDesc("Print the result as JSON on stdout");
  return opt;
}

const Opt& optJobs() {
  static const Opt opt =
      Opt{ "--jobs" }
          .setShort("-j")
          .setDesc("Number of installations probed in parallel")
          .setPlaceholder("<NUM>");
  return opt;
}

const Subcmd* Cli::find(const std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      subcmds, [&](const Subcmd* subcmd) { return subcmd->getName() == name; });
  return it == subcmds.end() ? nullptr : *it;
}

void Cli::printMainHelp() const {
  fmt::print("jvminspect {}\n"
             "Classify Java installation directories\n\n"
             "Usage: jvminspect [OPTIONS] [COMMAND]\n\n"
             "Options:\n",
             JVMINSPECT_VERSION);
  printGlobalOpts();
  printOptLine("-V, --version", "Print version info and exit");
  fmt::print("\nCommands:\n");
  for (const Subcmd* subcmd : subcmds) {
    fmt::print("  {:<{}}{}\n", subcmd->getName(), HELP_INDENT,
               subcmd->getDesc());
  }
  fmt::print("\nSee 'jvminspect help <command>' for more information on a "
             "specific command.\n");
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printMainHelp();
    return rs::Ok();
  }
  rs_ensure(args.size() == 1, "help takes at most one command");

  const Subcmd* subcmd = find(args.front());
  rs_ensure(subcmd != nullptr, "no such command: `{}`", args.front());
  subcmd->printHelp();
  return rs::Ok();
}

rs::Result<Cli::ControlFlow> Cli::handleGlobalOpts(CliArgsIter& itr,
                                                   const CliArgsIter end,
                                                   const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printMainHelp();
    } else {
      const Subcmd* found = getCli().find(subcmd);
      rs_ensure(found != nullptr, "no such command: `{}`", subcmd);
      found->printHelp();
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    Diag::setLevel(Diag::Verbose);
    return rs::Ok(Continue);
  } else if (arg == "-vv") {
    Diag::setLevel(Diag::VeryVerbose);
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    Diag::setLevel(Diag::Error);
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    if (itr + 1 == end) {
      rs_bail("Missing argument for `{}`", arg);
    }
    rs_try(setColorMode(*++itr));
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

rs::Result<void> Cli::parseArgs(const CliArgsView args) const {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(handleGlobalOpts(itr, args.end(), ""));
    if (control == Return) {
      return rs::Ok();
    } else if (control == Continue) {
      continue;
    } else if (matchesAny(arg, { "-V", "--version" })) {
      fmt::print("jvminspect {}\n", JVMINSPECT_VERSION);
      return rs::Ok();
    } else if (arg.starts_with('-')) {
      rs_bail("unexpected argument '{}' found\n\n"
              "For more information, try 'jvminspect --help'",
              arg);
    }

    const Subcmd* subcmd = find(arg);
    rs_ensure(subcmd != nullptr,
              "no such command: `{}`\n\n"
              "For a list of commands, try 'jvminspect help'",
              arg);
    return subcmd->run(CliArgsView(itr + 1, args.end()));
  }

  printMainHelp();
  return rs::Ok();
}

} // namespace jvminspect
