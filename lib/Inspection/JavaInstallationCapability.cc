#include "Inspection/JavaInstallationCapability.hpp"

#include "OperatingSystem.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <string_view>
#include <system_error>

namespace jvminspect {

std::string_view
toString(const JavaInstallationCapability capability) noexcept {
  switch (capability) {
  case JavaInstallationCapability::JavaCompiler:
    return "JAVA_COMPILER";
  }
  __builtin_unreachable();
}

fs::path javaCompilerPath(const fs::path& javaHome, const OperatingSystem& os) {
  return javaHome / "bin" / os.getExecutableName("javac");
}

JavaInstallationCapabilities gatherCapabilities(const fs::path& javaHome,
                                                const OperatingSystem& os) {
  JavaInstallationCapabilities capabilities;

  const fs::path javaCompiler = javaCompilerPath(javaHome, os);
  std::error_code ec;
  const bool hasCompiler = fs::exists(javaCompiler, ec);
  if (ec) {
    spdlog::debug("Treating {} as absent: {}", javaCompiler.string(),
                  ec.message());
  } else if (hasCompiler) {
    capabilities.insert(JavaInstallationCapability::JavaCompiler);
  }

  spdlog::trace("Probed {}: compiler {}", javaHome.string(),
                hasCompiler && !ec ? "found" : "not found");
  return capabilities;
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <chrono>
#  include <fstream>
#  include <string>
#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static fs::path makeScratchDir() {
  const auto ticks =
      std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("jvminspect-capability-{}", ticks);
  fs::create_directories(dir);
  return dir;
}

static void testJavaCompilerPath() {
  assertEq(javaCompilerPath("/opt/jdk", OperatingSystem::Linux).string(),
           "/opt/jdk/bin/javac");
  assertEq(javaCompilerPath("/opt/jdk", OperatingSystem::Windows).string(),
           "/opt/jdk/bin/javac.exe");

  pass();
}

static void testGatherCapabilities() {
  const fs::path home = makeScratchDir();

  assertTrue(gatherCapabilities(home).empty());
  assertTrue(gatherCapabilities(home / "does-not-exist").empty());

  fs::create_directories(home / "bin");
  std::ofstream(javaCompilerPath(home)) << "#!/bin/sh\n";
  assertTrue(gatherCapabilities(home)
             == JavaInstallationCapabilities{
                 JavaInstallationCapability::JavaCompiler });

  // Only the host's executable name counts.
  assertTrue(gatherCapabilities(home, OperatingSystem::current().isWindows()
                                          ? OperatingSystem::Linux
                                          : OperatingSystem::Windows)
                 .empty());

  fs::remove_all(home);
  pass();
}

static void testGatherCapabilitiesOnIoError() {
  // ENAMETOOLONG from stat() counts as a missing compiler.
  const fs::path tooLong = fs::temp_directory_path() / std::string(300, 'a');
  assertTrue(gatherCapabilities(tooLong).empty());

  pass();
}

static void testToString() {
  assertEq(toString(JavaInstallationCapability::JavaCompiler),
           "JAVA_COMPILER");
  assertEq(fmt::format("{}", JavaInstallationCapability::JavaCompiler),
           "JAVA_COMPILER");

  pass();
}

} // namespace tests

int main() {
  tests::testJavaCompilerPath();
  tests::testGatherCapabilities();
  tests::testGatherCapabilitiesOnIoError();
  tests::testToString();
}

#endif
