#pragma once

#include <string>
#include <string_view>

namespace jvminspect {

std::string toLower(std::string_view str);
std::string_view trim(std::string_view str) noexcept;

// ASCII case-insensitive substring search.
bool containsIgnoreCase(std::string_view haystack,
                        std::string_view needle) noexcept;
bool endsWithIgnoreCase(std::string_view str,
                        std::string_view suffix) noexcept;

} // namespace jvminspect
