#include "TermColor.hpp"

#include <cstdio>
#include <cstdlib>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string_view>
#include <unistd.h>

namespace jvminspect {

rs::Result<ColorMode> parseColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return rs::Ok(ColorMode::Always);
  } else if (str == "auto") {
    return rs::Ok(ColorMode::Auto);
  } else if (str == "never") {
    return rs::Ok(ColorMode::Never);
  }
  rs_bail("invalid color mode `{}`, expected one of always, auto, never", str);
}

static ColorMode colorModeFromEnv() noexcept {
  const char* env = std::getenv("JVMINSPECT_TERM_COLOR");
  if (env == nullptr) {
    return ColorMode::Auto;
  }
  auto mode = parseColorMode(env);
  if (mode.is_err()) {
    spdlog::warn("ignoring JVMINSPECT_TERM_COLOR: {}",
                 mode.unwrap_err()->what());
    return ColorMode::Auto;
  }
  return mode.unwrap();
}

static ColorMode& colorMode() noexcept {
  static ColorMode mode = colorModeFromEnv();
  return mode;
}

void setColorMode(const ColorMode mode) noexcept { colorMode() = mode; }

rs::Result<void> setColorMode(const std::string_view str) noexcept {
  setColorMode(rs_try(parseColorMode(str)));
  return rs::Ok();
}

ColorMode getColorMode() noexcept { return colorMode(); }

static bool shouldColor(std::FILE* stream) noexcept {
  switch (getColorMode()) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    return isatty(fileno(stream)) != 0;
  }
  __builtin_unreachable();
}

bool shouldColorStderr() noexcept { return shouldColor(stderr); }

} // namespace jvminspect
