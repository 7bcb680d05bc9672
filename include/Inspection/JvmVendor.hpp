#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace jvminspect {

class JvmVendor {
public:
  enum class KnownJvmVendor : std::uint8_t {
    Adoptium,
    AdoptOpenJdk,
    Amazon,
    Apple,
    Azul,
    BellSoft,
    GraalVm,
    HewlettPackard,
    Ibm,
    JetBrains,
    Microsoft,
    Oracle,
    Sap,
    Tencent,
    Unknown,
  };

  // Classifies the `java.vendor` string reported by a runtime.  Total: any
  // string, including the empty one, maps to exactly one known vendor.
  static JvmVendor fromString(std::string rawVendor);

  const std::string& getRawVendor() const noexcept { return rawVendor; }
  KnownJvmVendor getKnownVendor() const noexcept { return knownVendor; }

  // The vendor's canonical label, or the raw string for unknown vendors.
  std::string getDisplayName() const;

  bool operator==(const JvmVendor& other) const = default;

private:
  JvmVendor(std::string rawVendor, KnownJvmVendor knownVendor) noexcept;

  std::string rawVendor;
  KnownJvmVendor knownVendor;
};

// Canonical label of a known vendor; "Unknown Vendor" for Unknown.
std::string_view displayNameOf(JvmVendor::KnownJvmVendor vendor) noexcept;
// Upper snake case identifier such as "ORACLE" or "GRAAL_VM".
std::string_view toString(JvmVendor::KnownJvmVendor vendor) noexcept;

} // namespace jvminspect

template <>
struct fmt::formatter<jvminspect::JvmVendor::KnownJvmVendor>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const jvminspect::JvmVendor::KnownJvmVendor vendor,
              FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        jvminspect::toString(vendor), ctx);
  }
};
