#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "show a JDK"_test = [] {
    const tests::TempDir tmp;
    const auto home = tests::makeJavaHome(tmp.path, "jdk-17", true);

    const auto result =
        tests::runJvminspect({ "show", home.string(), "--version", "17.0.8",
                               "--vendor", "Oracle Corporation",
                               "--implementation", "OpenJDK 64-Bit Server VM" })
            .unwrap();
    expect(result.success()) << result.err;

    const std::string expectedOut = fmt::format(
        "Display name:   OpenJDK 17\n"
        "Java home:      {}\n"
        "Version:        17.0.8\n"
        "Vendor:         Oracle Corporation (ORACLE)\n"
        "Implementation: OpenJDK 64-Bit Server VM\n"
        "Capabilities:   JAVA_COMPILER\n",
        home.string());
    expect(result.out == expectedOut) << result.out;
    expect(result.err.empty()) << result.err;
  };

  "show a JRE with a relative home"_test = [] {
    const tests::TempDir tmp;
    tests::makeJavaHome(tmp.path, "jre-8", false);

    const auto result =
        tests::runJvminspect({ "show", "jre-8", "--version", "1.8.0",
                               "--vendor", "IBM Corporation" },
                             tmp.path)
            .unwrap();
    expect(result.success()) << result.err;
    expect(result.out.starts_with("Display name:   IBM JRE 8\n"))
        << result.out;
    expect(result.out.find(
               fmt::format("Java home:      {}\n", (tmp / "jre-8").string()))
           != std::string::npos)
        << result.out;
    expect(result.out.ends_with("Capabilities:   none\n")) << result.out;
  };

  "show a failed probe"_test = [] {
    const auto result =
        tests::runJvminspect({ "show", "/opt/missing", "--error",
                               "home directory does not exist" })
            .unwrap();
    expect(result.success()) << result.err;
    expect(result.out
           == "Display name:   Invalid installation: home directory does not "
              "exist\n"
              "Java home:      /opt/missing\n"
              "Error:          home directory does not exist\n")
        << result.out;
  };

  "show --json"_test = [] {
    const tests::TempDir tmp;
    const auto home = tests::makeJavaHome(tmp.path, "corretto", true);

    const auto result =
        tests::runJvminspect({ "show", home.string(), "--version", "21",
                               "--vendor", "Amazon.com Inc.", "--json" })
            .unwrap();
    expect(result.success()) << result.err;

    const auto json = nlohmann::json::parse(result.out);
    expect(json.at("javaHome") == home.string());
    expect(json.at("displayName") == "Amazon Corretto JDK 21");
    expect(json.at("languageVersion") == "21.0.0");
    expect(json.at("majorVersion") == 21);
    expect(json.at("knownVendor") == "AMAZON");
  };

  "show requires a home"_test = [] {
    const auto result = tests::runJvminspect({ "show" }).unwrap();
    expect(!result.success());
    expect(result.err
           == "Error: the following required argument was not provided: "
              "<HOME>\n")
        << result.err;
  };

  "show requires a version"_test = [] {
    const auto result =
        tests::runJvminspect({ "show", "/opt/jdk", "--vendor", "Oracle" })
            .unwrap();
    expect(!result.success());
    expect(result.err
           == "Error: the following required argument was not provided: "
              "--version <VERSION>\n")
        << result.err;
  };

  "show rejects a bad version"_test = [] {
    const auto result =
        tests::runJvminspect(
            { "show", "/opt/jdk", "--version", "0", "--vendor", "Oracle" })
            .unwrap();
    expect(!result.success());
    expect(result.err
           == "Error: invalid Java version `0`: major version must not be 0\n")
        << result.err;
  };

  "show rejects mixing --error with probed facts"_test = [] {
    const auto result =
        tests::runJvminspect({ "show", "/opt/jdk", "--error", "boom",
                               "--version", "17" })
            .unwrap();
    expect(!result.success());
    expect(result.err.starts_with("Error: `--error` cannot be used with"))
        << result.err;
  };

  "show rejects a missing option value"_test = [] {
    const auto result =
        tests::runJvminspect({ "show", "/opt/jdk", "--vendor" }).unwrap();
    expect(!result.success());
    expect(result.err.starts_with("Error: ")) << result.err;
  };
}
