#include "OperatingSystem.hpp"

#include "Algos.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jvminspect {

OperatingSystem OperatingSystem::current() noexcept {
#if defined(_WIN32)
  return Windows;
#elif defined(__APPLE__)
  return MacOs;
#elif defined(__linux__)
  return Linux;
#elif defined(__FreeBSD__)
  return FreeBsd;
#else
  return Unix;
#endif
}

OperatingSystem
OperatingSystem::forName(const std::string_view osName) noexcept {
  if (containsIgnoreCase(osName, "windows")) {
    return Windows;
  }
  if (containsIgnoreCase(osName, "mac")
      || containsIgnoreCase(osName, "darwin")) {
    return MacOs;
  }
  if (containsIgnoreCase(osName, "linux")) {
    return Linux;
  }
  if (containsIgnoreCase(osName, "freebsd")) {
    return FreeBsd;
  }
  return Unix;
}

std::string_view OperatingSystem::getName() const noexcept {
  switch (family) {
  case Windows:
    return "Windows";
  case MacOs:
    return "Mac OS X";
  case Linux:
    return "Linux";
  case FreeBsd:
    return "FreeBSD";
  case Unix:
    return "Unix";
  }
  __builtin_unreachable();
}

// Drops the extension of the last path segment, if any.
static std::string_view removeExtension(const std::string_view path) {
  const std::size_t lastSep = path.find_last_of("/\\");
  const std::size_t nameStart =
      lastSep == std::string_view::npos ? 0 : lastSep + 1;
  const std::size_t dot = path.rfind('.');
  if (dot == std::string_view::npos || dot <= nameStart) {
    return path;
  }
  return path.substr(0, dot);
}

std::string
OperatingSystem::getExecutableName(const std::string_view executablePath) const {
  if (!isWindows()) {
    return std::string(executablePath);
  }

  static constexpr std::string_view exeExt = ".exe";
  if (endsWithIgnoreCase(executablePath, exeExt)) {
    return std::string(executablePath);
  }
  std::string res(removeExtension(executablePath));
  res += exeExt;
  return res;
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static void testForName() {
  assertTrue(OperatingSystem::forName("Windows 11")
             == OperatingSystem::Windows);
  assertTrue(OperatingSystem::forName("Mac OS X") == OperatingSystem::MacOs);
  assertTrue(OperatingSystem::forName("Darwin") == OperatingSystem::MacOs);
  assertTrue(OperatingSystem::forName("Linux") == OperatingSystem::Linux);
  assertTrue(OperatingSystem::forName("FreeBSD") == OperatingSystem::FreeBsd);
  assertTrue(OperatingSystem::forName("SunOS") == OperatingSystem::Unix);
  assertTrue(OperatingSystem::forName("") == OperatingSystem::Unix);

  pass();
}

static void testGetExecutableName() {
  const OperatingSystem windows = OperatingSystem::Windows;
  assertEq(windows.getExecutableName("javac"), "javac.exe");
  assertEq(windows.getExecutableName("javac.exe"), "javac.exe");
  assertEq(windows.getExecutableName("JAVAC.EXE"), "JAVAC.EXE");
  assertEq(windows.getExecutableName("javac.bat"), "javac.exe");
  assertEq(windows.getExecutableName("jdk-17.0.2/bin/javac"),
           "jdk-17.0.2/bin/javac.exe");
  assertEq(windows.getExecutableName(".javac"), ".javac.exe");

  for (const OperatingSystem os :
       { OperatingSystem::Linux, OperatingSystem::MacOs,
         OperatingSystem::FreeBsd, OperatingSystem::Unix }) {
    assertEq(os.getExecutableName("javac"), "javac");
    assertEq(os.getExecutableName("javac.exe"), "javac.exe");
  }

  pass();
}

static void testCurrent() {
#  if defined(__linux__)
  assertTrue(OperatingSystem::current() == OperatingSystem::Linux);
  assertEq(fmt::format("{}", OperatingSystem::current()), "Linux");
#  endif
  assertEq(OperatingSystem::current().isWindows(),
           OperatingSystem::current().getExecutableName("javac") == "javac.exe");

  pass();
}

} // namespace tests

int main() {
  tests::testForName();
  tests::testGetExecutableName();
  tests::testCurrent();
}

#endif
