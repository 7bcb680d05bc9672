#include "OperatingSystem.hpp"
#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "jvminspect version"_test = [] {
    const auto result = tests::runJvminspect({ "version" }).unwrap();
    expect(result.success());

    static const std::regex pattern(
        R"(^jvminspect ([0-9]+\.[0-9]+\.[0-9]+)\n)");
    std::smatch match;
    expect(std::regex_search(result.out, match, pattern)) << result.out;

    const std::string expectedOut =
        fmt::format("jvminspect {}\nhost: {}\n", match[1].str(),
                    jvminspect::OperatingSystem::current());
    expect(result.out == expectedOut) << result.out;
    expect(result.err.empty()) << result.err;
  };

  "jvminspect --version"_test = [] {
    const auto result = tests::runJvminspect({ "-V" }).unwrap();
    expect(result.success());
    expect(result.out.starts_with("jvminspect ")) << result.out;
    expect(result.out.find("host:") == std::string::npos);
  };

  "version rejects arguments"_test = [] {
    const auto result = tests::runJvminspect({ "version", "extra" }).unwrap();
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: ")) << result.err;
  };

  "main help lists commands"_test = [] {
    const auto result = tests::runJvminspect({ "--help" }).unwrap();
    expect(result.success());
    for (const char* cmd : { "help", "list", "show", "version" }) {
      expect(result.out.find(fmt::format("\n  {}", cmd)) != std::string::npos)
          << "missing command" << cmd;
    }
  };

  "help for a subcommand"_test = [] {
    const auto result = tests::runJvminspect({ "help", "show" }).unwrap();
    expect(result.success());
    expect(result.out.find("Usage: jvminspect show [OPTIONS] <HOME>")
           != std::string::npos)
        << result.out;
    expect(result.out.find("--implementation <NAME>") != std::string::npos);
  };

  "unknown command"_test = [] {
    const auto result = tests::runJvminspect({ "frobnicate" }).unwrap();
    expect(!result.success());
    expect(result.err.starts_with("Error: no such command: `frobnicate`"))
        << result.err;
  };
}
