#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>

static tests::fs::path writeInventory(const tests::fs::path& root) {
  const auto openJdk = tests::makeJavaHome(root, "openjdk-17", true);
  tests::makeJavaHome(root, "temurin-11", false);
  tests::writeFile(root / "jvms.toml", fmt::format(R"([[installation]]
home = "{}"
version = "17.0.8"
vendor = "Oracle Corporation"
implementation = "OpenJDK 64-Bit Server VM"

[[installation]]
home = "temurin-11"
version = "11"
vendor = "Eclipse Adoptium"

[[installation]]
home = "broken"
error = "home directory does not exist"
)",
                                                   openJdk.string()));
  return root / "jvms.toml";
}

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "list prints one line per installation"_test = [] {
    const tests::TempDir tmp;
    writeInventory(tmp.path);

    const auto result = tests::runJvminspect({ "list" }, tmp.path).unwrap();
    expect(result.success()) << result.err;

    const std::string expectedOut = fmt::format(
        "OpenJDK 17 ({})\n"
        "Eclipse Temurin JRE 11 ({})\n"
        "Invalid installation: home directory does not exist ({})\n",
        (tmp / "openjdk-17").string(), (tmp / "temurin-11").string(),
        (tmp / "broken").string());
    expect(result.out == expectedOut) << result.out;
    expect(result.err == "   Inspected 3 installations (1 invalid)\n")
        << result.err;
  };

  "list finds the inventory from a subdirectory"_test = [] {
    const tests::TempDir tmp;
    writeInventory(tmp.path);
    const auto nested = tmp / "a" / "b";
    tests::fs::create_directories(nested);

    const auto result = tests::runJvminspect({ "list" }, nested).unwrap();
    expect(result.success()) << result.err;
    expect(result.out.starts_with("OpenJDK 17 (")) << result.out;
  };

  "list reads an explicit inventory"_test = [] {
    const tests::TempDir tmp;
    const auto inventory = writeInventory(tmp / "elsewhere");
    const tests::TempDir cwd;

    const auto result =
        tests::runJvminspect({ "list", "--file", inventory.string(), "-q" },
                             cwd.path)
            .unwrap();
    expect(result.success()) << result.err;
    expect(result.out.find("Eclipse Temurin JRE 11") != std::string::npos)
        << result.out;
    expect(result.err.empty()) << result.err;
  };

  "list --json"_test = [] {
    const tests::TempDir tmp;
    writeInventory(tmp.path);

    const auto result =
        tests::runJvminspect({ "list", "--json", "-j", "2" }, tmp.path)
            .unwrap();
    expect(result.success()) << result.err;

    const auto json = nlohmann::json::parse(result.out);
    expect(json.is_array() && json.size() == 3);
    expect(json[0].at("displayName") == "OpenJDK 17");
    expect(json[0].at("knownVendor") == "ORACLE");
    expect(json[0].at("capabilities")
           == nlohmann::json::array({ "JAVA_COMPILER" }));
    expect(json[1].at("capabilities").empty());
    expect(json[1].at("implementationName") == "");
    expect(json[2].at("valid") == false);
    expect(json[2].at("errorMessage") == "home directory does not exist");
  };

  "list with an empty inventory"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "jvms.toml", "");

    const auto result = tests::runJvminspect({ "list" }, tmp.path).unwrap();
    expect(result.success()) << result.err;
    expect(result.out.empty());
    expect(result.err.starts_with("Warning: no installations listed in"))
        << result.err;
    expect(result.err.ends_with("   Inspected 0 installations (0 invalid)\n"))
        << result.err;
  };

  "list without an inventory"_test = [] {
    const tests::TempDir tmp;
    const auto result =
        tests::runJvminspect({ "list", "--file", (tmp / "jvms.toml").string() },
                             tmp.path)
            .unwrap();
    expect(!result.success());
    expect(result.out.empty());
    expect(result.err
           == fmt::format("Error: inventory `{}` does not exist\n",
                          (tmp / "jvms.toml").string()))
        << result.err;
  };

  "list reports an inaccessible inventory"_test = [] {
    const tests::TempDir tmp;
    const auto tooLong = tmp / std::string(300, 'a') / "jvms.toml";

    const auto result =
        tests::runJvminspect({ "list", "-f", tooLong.string() }, tmp.path)
            .unwrap();
    expect(result.status == 1) << result.status;
    expect(result.out.empty());
    expect(result.err.starts_with(fmt::format(
               "Error: cannot access inventory `{}`: ", tooLong.string())))
        << result.err;
  };

  "list reports malformed entries"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "jvms.toml", R"([[installation]]
home = "/opt/jdk"
version = "17.x"
vendor = "Oracle Corporation"
)");

    const auto result = tests::runJvminspect({ "list" }, tmp.path).unwrap();
    expect(!result.success());
    expect(result.err
           == "Error: installation #1: invalid Java version `17.x`: "
              "`x` is not a number\n")
        << result.err;
  };

  "list rejects a bad job count"_test = [] {
    const tests::TempDir tmp;
    writeInventory(tmp.path);

    const auto result =
        tests::runJvminspect({ "list", "--jobs", "0" }, tmp.path).unwrap();
    expect(!result.success());
    expect(result.err == "Error: invalid number of threads: 0\n")
        << result.err;
  };
}
