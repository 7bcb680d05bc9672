#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jvminspect {

using CliArgsView = std::span<const std::string>;
using CliArgsIter = CliArgsView::iterator;

bool matchesAny(std::string_view arg,
                std::initializer_list<std::string_view> patterns) noexcept;

class Opt {
public:
  explicit Opt(std::string_view name) noexcept : name(name) {}

  Opt& setShort(std::string_view shortName) noexcept;
  Opt& setDesc(std::string_view desc) noexcept;
  Opt& setPlaceholder(std::string_view placeholder) noexcept;

  std::string usage() const;
  std::string_view getDesc() const noexcept { return desc; }

private:
  std::string_view name;
  std::string_view shortName;
  std::string_view desc;
  std::string_view placeholder;
};

class Arg {
public:
  explicit Arg(std::string_view name) noexcept : name(name) {}

  Arg& setDesc(std::string_view desc) noexcept;
  Arg& setRequired(bool required) noexcept;

  std::string usage() const;

private:
  std::string_view name;
  std::string_view desc;
  bool required = true;
};

class Subcmd {
public:
  using MainFn = rs::Result<void>(CliArgsView);

  explicit Subcmd(std::string_view name) noexcept : name(name) {}

  Subcmd& setDesc(std::string_view desc) noexcept;
  Subcmd& addOpt(Opt opt);
  Subcmd& setArg(Arg arg);
  Subcmd& setMainFn(MainFn* mainFn) noexcept;

  std::string_view getName() const noexcept { return name; }
  std::string_view getDesc() const noexcept { return desc; }

  rs::Result<void> run(CliArgsView args) const;
  void printHelp() const;

  rs::Result<void> noSuchArg(std::string_view arg) const;
  static rs::Result<void> missingOptArgumentFor(std::string_view arg);

private:
  std::string_view name;
  std::string_view desc;
  std::vector<Opt> opts;
  std::optional<Arg> arg;
  MainFn* mainFn = nullptr;
};

// Options shared by several subcommands.
const Opt& optJson();
const Opt& optJobs();

class Cli {
public:
  enum ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  explicit Cli(std::vector<const Subcmd*> subcmds) noexcept
      : subcmds(std::move(subcmds)) {}

  rs::Result<void> parseArgs(CliArgsView args) const;
  rs::Result<void> printHelp(CliArgsView args) const;

  // Handles options accepted everywhere (`--help`, `--verbose`, ...).
  // `subcmd` is empty at the top level.
  static rs::Result<ControlFlow>
  handleGlobalOpts(CliArgsIter& itr, CliArgsIter end, std::string_view subcmd);

private:
  std::vector<const Subcmd*> subcmds;

  const Subcmd* find(std::string_view name) const noexcept;
  void printMainHelp() const;
};

const Cli& getCli();

} // namespace jvminspect
