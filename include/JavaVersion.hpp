#pragma once

#include <compare>
#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace jvminspect {

// The language version of an installation, already split into its numeric
// components by whoever probed the installation.
struct JavaVersion {
  std::uint32_t major = 0;
  std::uint32_t minor = 0;
  std::uint32_t patch = 0;

  constexpr JavaVersion() noexcept = default;
  constexpr JavaVersion(const std::uint32_t major,
                        const std::uint32_t minor = 0,
                        const std::uint32_t patch = 0) noexcept
      : major(major), minor(minor), patch(patch) {}

  // Accepts `MAJOR[.MINOR[.PATCH]]` and the legacy `1.MAJOR[.PATCH]` form.
  static rs::Result<JavaVersion> parse(std::string_view str) noexcept;

  constexpr std::uint32_t getMajorVersion() const noexcept { return major; }
  std::string toString() const;

  constexpr auto operator<=>(const JavaVersion&) const noexcept = default;
};

} // namespace jvminspect

template <>
struct fmt::formatter<jvminspect::JavaVersion>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const jvminspect::JavaVersion& version,
              FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(version.toString(), ctx);
  }
};
