#pragma once

#include <cstdint>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <utility>

namespace jvminspect {

// User-facing status output.  Everything goes to stderr so that stdout only
// carries command results.
class Diag {
public:
  enum class Level : std::uint8_t {
    Off,
    Error,
    Warn,
    Info,
    Verbose,
    VeryVerbose,
  };
  using enum Level;

  static void setLevel(Level level) noexcept;
  static Level getLevel() noexcept;

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < Error) {
      return;
    }
    emit(paint("Error:", fmt::terminal_color::red),
         fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < Warn) {
      return;
    }
    emit(paint("Warning:", fmt::terminal_color::yellow),
         fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Prints `header` right-aligned in a 12 column field, e.g.
  // "   Inspected 3 installations".
  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < Info) {
      return;
    }
    emit(paint(fmt::format("{:>12}", header), fmt::terminal_color::green),
         fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  static std::string paint(std::string_view text, fmt::terminal_color color);
  static void emit(std::string_view header, std::string_view body) noexcept;
};

} // namespace jvminspect
