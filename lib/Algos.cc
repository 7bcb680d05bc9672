#include "Algos.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace jvminspect {

static char asciiLower(const char c) noexcept {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string toLower(const std::string_view str) {
  std::string res;
  res.reserve(str.size());
  for (const char c : str) {
    res.push_back(asciiLower(c));
  }
  return res;
}

std::string_view trim(std::string_view str) noexcept {
  const auto isSpace = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!str.empty() && isSpace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && isSpace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

bool containsIgnoreCase(const std::string_view haystack,
                        const std::string_view needle) noexcept {
  const auto it = std::ranges::search(
      haystack, needle, [](const char lhs, const char rhs) {
        return asciiLower(lhs) == asciiLower(rhs);
      });
  return needle.empty() || it.begin() != haystack.end();
}

bool endsWithIgnoreCase(const std::string_view str,
                        const std::string_view suffix) noexcept {
  if (suffix.size() > str.size()) {
    return false;
  }
  return std::ranges::equal(
      str.substr(str.size() - suffix.size()), suffix,
      [](const char lhs, const char rhs) {
        return asciiLower(lhs) == asciiLower(rhs);
      });
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static void testToLower() {
  assertEq(toLower(""), "");
  assertEq(toLower("Oracle Corporation"), "oracle corporation");
  assertEq(toLower("HP-UX 11"), "hp-ux 11");
  // Allocates, so it may throw std::bad_alloc.
  static_assert(!noexcept(toLower("")));

  pass();
}

static void testTrim() {
  assertEq(trim(""), "");
  assertEq(trim("   "), "");
  assertEq(trim("\tAzul Systems, Inc.\n"), "Azul Systems, Inc.");

  pass();
}

static void testContainsIgnoreCase() {
  assertTrue(containsIgnoreCase("OpenJDK", "jdk"));
  assertTrue(containsIgnoreCase("AdoptOpenJDK", "ADOPTOPENJDK"));
  assertTrue(containsIgnoreCase("anything", ""));
  assertFalse(containsIgnoreCase("Oracle", "jdk"));
  assertFalse(containsIgnoreCase("", "jdk"));
  assertFalse(containsIgnoreCase("jd", "jdk"));

  pass();
}

static void testEndsWithIgnoreCase() {
  assertTrue(endsWithIgnoreCase("javac.EXE", ".exe"));
  assertTrue(endsWithIgnoreCase("javac.exe", ".exe"));
  assertFalse(endsWithIgnoreCase("javac", ".exe"));
  assertFalse(endsWithIgnoreCase("exe", ".exe"));
  assertFalse(endsWithIgnoreCase("javac.exf", ".exe"));
  assertTrue(endsWithIgnoreCase("javac", ""));

  pass();
}

} // namespace tests

int main() {
  tests::testToLower();
  tests::testTrim();
  tests::testContainsIgnoreCase();
  tests::testEndsWithIgnoreCase();
}

#endif
