#pragma once

#include "OperatingSystem.hpp"

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <set>
#include <string_view>

namespace jvminspect {

namespace fs = std::filesystem;

enum class JavaInstallationCapability : std::uint8_t {
  JavaCompiler,
};

using JavaInstallationCapabilities = std::set<JavaInstallationCapability>;

std::string_view toString(JavaInstallationCapability capability) noexcept;

// `<javaHome>/bin/javac`, with the executable suffix of `os`.
fs::path
javaCompilerPath(const fs::path& javaHome,
                 const OperatingSystem& os = OperatingSystem::current());

// Inspects `javaHome` on disk.  Never fails: an I/O error while checking a
// file is reported as the capability being absent.
JavaInstallationCapabilities
gatherCapabilities(const fs::path& javaHome,
                   const OperatingSystem& os = OperatingSystem::current());

} // namespace jvminspect

template <>
struct fmt::formatter<jvminspect::JavaInstallationCapability>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const jvminspect::JavaInstallationCapability capability,
              FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        jvminspect::toString(capability), ctx);
  }
};
