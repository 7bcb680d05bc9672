#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace jvminspect {

class OperatingSystem {
public:
  enum class Family : std::uint8_t {
    Windows,
    MacOs,
    Linux,
    FreeBsd,
    Unix,
  };
  using enum Family;

  constexpr OperatingSystem(Family family) noexcept // NOLINT
      : family(family) {}

  // The operating system this binary was compiled for.
  static OperatingSystem current() noexcept;
  // Classifies an `os.name` style string such as "Windows 11" or "Mac OS X".
  static OperatingSystem forName(std::string_view osName) noexcept;

  Family getFamily() const noexcept { return family; }
  bool isWindows() const noexcept { return family == Windows; }
  std::string_view getName() const noexcept;

  // Maps a platform independent executable name to the file name found on
  // disk.  Only Windows changes anything: `javac` becomes `javac.exe`.
  std::string getExecutableName(std::string_view executablePath) const;

  bool operator==(const OperatingSystem& other) const = default;

private:
  Family family;
};

} // namespace jvminspect

template <>
struct fmt::formatter<jvminspect::OperatingSystem>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const jvminspect::OperatingSystem& os, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(os.getName(), ctx);
  }
};
