#include "Diag.hpp"

#include "TermColor.hpp"

#include <cstdio>
#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace jvminspect {

static Diag::Level& diagLevel() noexcept {
  static Diag::Level level = Diag::Info;
  return level;
}

void Diag::setLevel(const Level level) noexcept {
  diagLevel() = level;
  switch (level) {
  case VeryVerbose:
    spdlog::set_level(spdlog::level::trace);
    break;
  case Verbose:
    spdlog::set_level(spdlog::level::debug);
    break;
  case Off:
    spdlog::set_level(spdlog::level::off);
    break;
  case Error:
  case Warn:
  case Info:
    spdlog::set_level(spdlog::level::warn);
    break;
  }
}

Diag::Level Diag::getLevel() noexcept { return diagLevel(); }

std::string Diag::paint(const std::string_view text,
                        const fmt::terminal_color color) {
  if (!shouldColorStderr()) {
    return std::string(text);
  }
  return fmt::format("{}",
                     fmt::styled(text, fmt::emphasis::bold | fmt::fg(color)));
}

void Diag::emit(const std::string_view header,
                const std::string_view body) noexcept {
  fmt::print(stderr, "{} {}\n", header, body);
}

} // namespace jvminspect
