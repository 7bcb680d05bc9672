#include "JavaVersion.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jvminspect {

static rs::Result<std::uint32_t> parseComponent(const std::string_view version,
                                                const std::string_view part) {
  rs_ensure(!part.empty(), "invalid Java version `{}`: empty component",
            version);

  std::uint32_t value{};
  const auto [ptr, ec] =
      std::from_chars(part.data(), part.data() + part.size(), value);
  rs_ensure(ec == std::errc() && ptr == part.data() + part.size(),
            "invalid Java version `{}`: `{}` is not a number", version, part);
  return rs::Ok(value);
}

rs::Result<JavaVersion>
JavaVersion::parse(const std::string_view str) noexcept {
  std::vector<std::uint32_t> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = str.find('.', start);
    const std::string_view part = str.substr(start, dot - start);
    parts.push_back(rs_try(parseComponent(str, part)));
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  rs_ensure(parts.size() <= 3,
            "invalid Java version `{}`: expected at most 3 components", str);

  // 1.8.0 means Java 8.
  if (parts.size() > 1 && parts[0] == 1) {
    const std::uint32_t patch = parts.size() == 3 ? parts[2] : 0;
    rs_ensure(parts[1] != 0, "invalid Java version `{}`", str);
    return rs::Ok(JavaVersion(parts[1], 0, patch));
  }

  rs_ensure(parts[0] != 0,
            "invalid Java version `{}`: major version must not be 0", str);
  const std::uint32_t minor = parts.size() > 1 ? parts[1] : 0;
  const std::uint32_t patch = parts.size() > 2 ? parts[2] : 0;
  return rs::Ok(JavaVersion(parts[0], minor, patch));
}

std::string JavaVersion::toString() const {
  return fmt::format("{}.{}.{}", major, minor, patch);
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static void testParse() {
  assertEq(JavaVersion::parse("17").unwrap(), JavaVersion(17));
  assertEq(JavaVersion::parse("17.0.8").unwrap(), JavaVersion(17, 0, 8));
  assertEq(JavaVersion::parse("21.1").unwrap(), JavaVersion(21, 1));
  assertEq(JavaVersion::parse("1.8").unwrap(), JavaVersion(8));
  assertEq(JavaVersion::parse("1.8.0").unwrap(), JavaVersion(8));
  assertEq(JavaVersion::parse("1.7.2").unwrap(), JavaVersion(7, 0, 2));

  // `1` alone is a (very old) major version, not the legacy prefix.
  assertEq(JavaVersion::parse("1").unwrap(), JavaVersion(1));

  pass();
}

static void testParseErrors() {
  assertEq(JavaVersion::parse("").unwrap_err()->what(),
           "invalid Java version ``: empty component");
  assertEq(JavaVersion::parse("17.").unwrap_err()->what(),
           "invalid Java version `17.`: empty component");
  assertEq(JavaVersion::parse("17-ea").unwrap_err()->what(),
           "invalid Java version `17-ea`: `17-ea` is not a number");
  assertEq(JavaVersion::parse("1.8.0_292").unwrap_err()->what(),
           "invalid Java version `1.8.0_292`: `0_292` is not a number");
  assertEq(JavaVersion::parse("17.0.8.1").unwrap_err()->what(),
           "invalid Java version `17.0.8.1`: expected at most 3 components");
  assertEq(JavaVersion::parse("0.9").unwrap_err()->what(),
           "invalid Java version `0.9`: major version must not be 0");
  assertEq(JavaVersion::parse("1.0").unwrap_err()->what(),
           "invalid Java version `1.0`");

  pass();
}

static void testOrderingAndFormat() {
  assertLt(JavaVersion(8), JavaVersion(11));
  assertLt(JavaVersion(17, 0, 2), JavaVersion(17, 0, 10));
  assertLt(JavaVersion(17, 9, 9), JavaVersion(21));
  assertEq(JavaVersion(21, 0, 1).toString(), "21.0.1");
  assertEq(fmt::format("{}", JavaVersion(11)), "11.0.0");
  assertEq(JavaVersion(25, 1).getMajorVersion(), 25U);

  pass();
}

} // namespace tests

int main() {
  tests::testParse();
  tests::testParseErrors();
  tests::testOrderingAndFormat();
}

#endif
