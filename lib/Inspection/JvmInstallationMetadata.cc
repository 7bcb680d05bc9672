#include "Inspection/JvmInstallationMetadata.hpp"

#include "Algos.hpp"
#include "Inspection/JavaInstallationCapability.hpp"
#include "Inspection/JvmVendor.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jvminspect {

// " JDK", " JRE", or nothing when the vendor name already says JDK
// (e.g. "OpenJDK 17" rather than "OpenJDK JDK 17").
static std::string_view determineInstallationType(const std::string_view vendor,
                                                  const bool hasCompiler) {
  if (hasCompiler) {
    if (!containsIgnoreCase(vendor, "jdk")) {
      return " JDK";
    }
    return "";
  }
  return " JRE";
}

JvmInstallationMetadata::JvmInstallationMetadata(Valid valid) noexcept
    : state(std::move(valid)) {}

JvmInstallationMetadata::JvmInstallationMetadata(Failure failure) noexcept
    : state(std::move(failure)) {}

JvmInstallationMetadata JvmInstallationMetadata::from(
    fs::path javaHome, JavaVersion languageVersion, std::string vendor,
    std::string implementationName) {
  return JvmInstallationMetadata(
      Valid{ .javaHome = std::move(javaHome),
             .languageVersion = languageVersion,
             .vendor = std::move(vendor),
             .implementationName = std::move(implementationName),
             .capabilities = std::make_unique<CapabilitiesCell>() });
}

JvmInstallationMetadata
JvmInstallationMetadata::failure(fs::path javaHome, std::string errorMessage) {
  return JvmInstallationMetadata(Failure{
      .javaHome = std::move(javaHome),
      .errorMessage = std::move(errorMessage),
  });
}

bool JvmInstallationMetadata::isValidInstallation() const noexcept {
  return std::holds_alternative<Valid>(state);
}

const fs::path& JvmInstallationMetadata::getJavaHome() const noexcept {
  return std::visit([](const auto& s) -> const fs::path& { return s.javaHome; },
                    state);
}

const JvmInstallationMetadata::Valid& JvmInstallationMetadata::valid() const {
  if (const auto* failure = std::get_if<Failure>(&state)) {
    throw UnsupportedOperation(
        fmt::format("Installation is not valid. Original error message: {}",
                    failure->errorMessage));
  }
  const Valid& self = std::get<Valid>(state);
  if (self.capabilities == nullptr) {
    throw UnsupportedOperation("Installation was moved from");
  }
  return self;
}

std::string JvmInstallationMetadata::getDisplayName() const {
  if (const auto* failure = std::get_if<Failure>(&state)) {
    return "Invalid installation: " + failure->errorMessage;
  }

  const std::string vendor = determineVendorName();
  const std::string_view installationType = determineInstallationType(
      vendor, hasCapability(JavaInstallationCapability::JavaCompiler));
  return fmt::format("{}{} {}", vendor, installationType,
                     getLanguageVersion().getMajorVersion());
}

std::string JvmInstallationMetadata::determineVendorName() const {
  const JvmVendor vendor = getVendor();
  if (vendor.getKnownVendor() == JvmVendor::KnownJvmVendor::Oracle
      && valid().implementationName.contains("OpenJDK")) {
    return "OpenJDK";
  }
  return vendor.getDisplayName();
}

const JavaVersion& JvmInstallationMetadata::getLanguageVersion() const {
  return valid().languageVersion;
}

JvmVendor JvmInstallationMetadata::getVendor() const {
  return JvmVendor::fromString(valid().vendor);
}

const std::string& JvmInstallationMetadata::getImplementationName() const {
  return valid().implementationName;
}

const JavaInstallationCapabilities&
JvmInstallationMetadata::getCapabilities() const {
  const Valid& self = valid();
  CapabilitiesCell& cell = *self.capabilities;
  std::call_once(cell.once, [&] {
    spdlog::debug("Probing capabilities of {}", self.javaHome.string());
    cell.value = gatherCapabilities(self.javaHome);
  });
  return cell.value;
}

bool JvmInstallationMetadata::hasCapability(
    const JavaInstallationCapability capability) const {
  return getCapabilities().contains(capability);
}

const std::string& JvmInstallationMetadata::getErrorMessage() const {
  if (const auto* valid = std::get_if<Valid>(&state)) {
    throw UnsupportedOperation(
        fmt::format("Valid installation has no error message: {}",
                    valid->javaHome.string()));
  }
  return std::get<Failure>(state).errorMessage;
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static void testDetermineInstallationType() {
  assertEq(determineInstallationType("Oracle", true), " JDK");
  assertEq(determineInstallationType("Oracle", false), " JRE");
  assertEq(determineInstallationType("OpenJDK", true), "");
  assertEq(determineInstallationType("OpenJDK", false), " JRE");
  assertEq(determineInstallationType("AdoptOpenJDK", true), "");
  assertEq(determineInstallationType("my jdk build", true), "");
  assertEq(determineInstallationType("", true), " JDK");

  pass();
}

static void testDisplayNameOfMissingHome() {
  // A home that does not exist has no compiler.
  const auto metadata = JvmInstallationMetadata::from(
      "/nonexistent/jvminspect/jdk", JavaVersion(21), "Eclipse Adoptium", "");
  assertEq(metadata.getDisplayName(), "Eclipse Temurin JRE 21");

  const auto openJdk =
      JvmInstallationMetadata::from("/nonexistent/jvminspect/jdk",
                                    JavaVersion(17), "Oracle Corporation",
                                    "OpenJDK 64-Bit Server VM");
  assertEq(openJdk.getDisplayName(), "OpenJDK JRE 17");

  // Only an Oracle vendor turns an OpenJDK implementation into "OpenJDK".
  const auto azul =
      JvmInstallationMetadata::from("/nonexistent/jvminspect/jdk",
                                    JavaVersion(11), "Azul Systems, Inc.",
                                    "OpenJDK 64-Bit Server VM");
  assertEq(azul.getDisplayName(), "Azul Zulu JRE 11");

  pass();
}

static void testFailure() {
  const auto metadata =
      JvmInstallationMetadata::failure("/opt/broken", "no release file");
  assertFalse(metadata.isValidInstallation());
  assertEq(metadata.getJavaHome().string(), "/opt/broken");
  assertEq(metadata.getErrorMessage(), "no release file");
  assertEq(metadata.getDisplayName(), "Invalid installation: no release file");

  try {
    (void)metadata.getVendor();
    error(std::source_location::current(), "expected UnsupportedOperation");
  } catch (const UnsupportedOperation& e) {
    assertEq(std::string_view(e.what()),
             "Installation is not valid. Original error message: "
             "no release file");
  }

  pass();
}

static void testMovedFrom() {
  auto metadata = JvmInstallationMetadata::from(
      "/nonexistent/jvminspect/jdk", JavaVersion(17), "Oracle Corporation", "");
  const JvmInstallationMetadata moved = std::move(metadata);
  assertEq(moved.getDisplayName(), "Oracle JRE 17");

  try {
    // NOLINTNEXTLINE(bugprone-use-after-move)
    (void)metadata.getCapabilities();
    error(std::source_location::current(), "expected UnsupportedOperation");
  } catch (const UnsupportedOperation& e) {
    assertEq(std::string_view(e.what()), "Installation was moved from");
  }

  pass();
}

} // namespace tests

int main() {
  tests::testDetermineInstallationType();
  tests::testDisplayNameOfMissingHome();
  tests::testFailure();
  tests::testMovedFrom();
}

#endif
