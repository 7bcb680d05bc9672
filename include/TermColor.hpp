#pragma once

#include <cstdint>
#include <rs/result.hpp>
#include <string_view>

namespace jvminspect {

enum class ColorMode : std::uint8_t {
  Always,
  Auto,
  Never,
};

rs::Result<ColorMode> parseColorMode(std::string_view str) noexcept;

void setColorMode(ColorMode mode) noexcept;
rs::Result<void> setColorMode(std::string_view str) noexcept;
ColorMode getColorMode() noexcept;

bool shouldColorStderr() noexcept;

} // namespace jvminspect
