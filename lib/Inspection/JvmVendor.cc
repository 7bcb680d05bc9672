#include "Inspection/JvmVendor.hpp"

#include "Algos.hpp"

#include <array>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

namespace jvminspect {

using KnownJvmVendor = JvmVendor::KnownJvmVendor;

struct VendorInfo {
  KnownJvmVendor vendor;
  std::string_view name;
  std::string_view displayName;
  std::array<std::string_view, 3> indicators;
};

// Matched in order; the first vendor with an indicator contained in the raw
// vendor string wins.  Indicators are lower case.
static constexpr std::array<VendorInfo, 15> VENDORS{ {
    { KnownJvmVendor::Adoptium,
      "ADOPTIUM",
      "Eclipse Temurin",
      { "temurin", "adoptium", "eclipse foundation" } },
    { KnownJvmVendor::AdoptOpenJdk,
      "ADOPTOPENJDK",
      "AdoptOpenJDK",
      { "adoptopenjdk" } },
    { KnownJvmVendor::Amazon, "AMAZON", "Amazon Corretto", { "amazon" } },
    { KnownJvmVendor::Apple, "APPLE", "Apple", { "apple" } },
    { KnownJvmVendor::Azul, "AZUL", "Azul Zulu", { "azul" } },
    { KnownJvmVendor::BellSoft,
      "BELLSOFT",
      "BellSoft Liberica",
      { "bellsoft" } },
    { KnownJvmVendor::GraalVm,
      "GRAAL_VM",
      "GraalVM Community",
      { "graalvm" } },
    { KnownJvmVendor::HewlettPackard,
      "HEWLETT_PACKARD",
      "HP-UX",
      { "hewlett-packard" } },
    { KnownJvmVendor::Ibm,
      "IBM",
      "IBM",
      { "ibm", "international business machines" } },
    { KnownJvmVendor::JetBrains, "JETBRAINS", "JetBrains", { "jetbrains" } },
    { KnownJvmVendor::Microsoft, "MICROSOFT", "Microsoft", { "microsoft" } },
    { KnownJvmVendor::Oracle, "ORACLE", "Oracle", { "oracle" } },
    { KnownJvmVendor::Sap, "SAP", "SAP SapMachine", { "sap se" } },
    { KnownJvmVendor::Tencent, "TENCENT", "Tencent", { "tencent" } },
    { KnownJvmVendor::Unknown, "UNKNOWN", "Unknown Vendor", {} },
} };

static const VendorInfo& infoOf(const KnownJvmVendor vendor) noexcept {
  return VENDORS[static_cast<std::size_t>(vendor)];
}

static KnownJvmVendor classify(const std::string_view rawVendor) {
  const std::string lowered = toLower(rawVendor);
  for (const VendorInfo& info : VENDORS) {
    for (const std::string_view indicator : info.indicators) {
      if (!indicator.empty() && lowered.contains(indicator)) {
        return info.vendor;
      }
    }
  }
  return KnownJvmVendor::Unknown;
}

JvmVendor::JvmVendor(std::string rawVendor,
                     const KnownJvmVendor knownVendor) noexcept
    : rawVendor(std::move(rawVendor)), knownVendor(knownVendor) {}

JvmVendor JvmVendor::fromString(std::string rawVendor) {
  const KnownJvmVendor knownVendor = classify(rawVendor);
  spdlog::trace("Vendor `{}` classified as {}", rawVendor, knownVendor);
  return { std::move(rawVendor), knownVendor };
}

std::string JvmVendor::getDisplayName() const {
  if (knownVendor != KnownJvmVendor::Unknown) {
    return std::string(displayNameOf(knownVendor));
  }
  if (trim(rawVendor).empty()) {
    return std::string(displayNameOf(KnownJvmVendor::Unknown));
  }
  return rawVendor;
}

std::string_view displayNameOf(const KnownJvmVendor vendor) noexcept {
  return infoOf(vendor).displayName;
}

std::string_view toString(const KnownJvmVendor vendor) noexcept {
  return infoOf(vendor).name;
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace jvminspect; // NOLINT(build/namespaces,google-build-using-namespace)

static void testTableOrder() {
  for (std::size_t i = 0; i < VENDORS.size(); ++i) {
    assertEq(static_cast<std::size_t>(VENDORS[i].vendor), i);
  }

  pass();
}

static void testFromString() {
  const auto knownVendorOf = [](std::string raw) {
    return JvmVendor::fromString(std::move(raw)).getKnownVendor();
  };

  assertTrue(knownVendorOf("Oracle Corporation") == KnownJvmVendor::Oracle);
  assertTrue(knownVendorOf("ORACLE CORPORATION") == KnownJvmVendor::Oracle);
  assertTrue(knownVendorOf("Eclipse Adoptium") == KnownJvmVendor::Adoptium);
  assertTrue(knownVendorOf("Temurin") == KnownJvmVendor::Adoptium);
  assertTrue(knownVendorOf("Eclipse Foundation") == KnownJvmVendor::Adoptium);
  assertTrue(knownVendorOf("AdoptOpenJDK") == KnownJvmVendor::AdoptOpenJdk);
  assertTrue(knownVendorOf("Amazon.com Inc.") == KnownJvmVendor::Amazon);
  assertTrue(knownVendorOf("Azul Systems, Inc.") == KnownJvmVendor::Azul);
  assertTrue(knownVendorOf("BellSoft") == KnownJvmVendor::BellSoft);
  assertTrue(knownVendorOf("GraalVM Community") == KnownJvmVendor::GraalVm);
  assertTrue(knownVendorOf("Hewlett-Packard Company")
             == KnownJvmVendor::HewlettPackard);
  assertTrue(knownVendorOf("IBM Corporation") == KnownJvmVendor::Ibm);
  assertTrue(knownVendorOf("International Business Machines Corporation")
             == KnownJvmVendor::Ibm);
  assertTrue(knownVendorOf("JetBrains s.r.o.") == KnownJvmVendor::JetBrains);
  assertTrue(knownVendorOf("Microsoft") == KnownJvmVendor::Microsoft);
  assertTrue(knownVendorOf("SAP SE") == KnownJvmVendor::Sap);
  assertTrue(knownVendorOf("Tencent") == KnownJvmVendor::Tencent);
  assertTrue(knownVendorOf("Acme Runtimes") == KnownJvmVendor::Unknown);
  assertTrue(knownVendorOf("") == KnownJvmVendor::Unknown);

  pass();
}

static void testDisplayName() {
  assertEq(JvmVendor::fromString("Oracle Corporation").getDisplayName(),
           "Oracle");
  assertEq(JvmVendor::fromString("Azul Systems, Inc.").getDisplayName(),
           "Azul Zulu");
  assertEq(JvmVendor::fromString("Acme Runtimes").getDisplayName(),
           "Acme Runtimes");
  assertEq(JvmVendor::fromString("").getDisplayName(), "Unknown Vendor");
  assertEq(JvmVendor::fromString("  ").getDisplayName(), "Unknown Vendor");

  const JvmVendor vendor = JvmVendor::fromString("Amazon.com Inc.");
  assertEq(vendor.getRawVendor(), "Amazon.com Inc.");
  assertEq(fmt::format("{}", vendor.getKnownVendor()), "AMAZON");

  pass();
}

} // namespace tests

int main() {
  tests::testTableOrder();
  tests::testFromString();
  tests::testDisplayName();
}

#endif
