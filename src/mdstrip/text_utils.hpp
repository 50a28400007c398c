#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdstrip {

[[nodiscard]] constexpr bool is_space(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
           c == '\f';
}

[[nodiscard]] constexpr bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] std::string_view trim(const std::string_view sv) noexcept;
[[nodiscard]] std::string_view trim_left(const std::string_view sv) noexcept;

[[nodiscard]] bool is_blank(const std::string_view sv) noexcept;

// Splits on '\n' only. `"a\n"` yields `{"a", ""}`, so that joining the
// result back with '\n' reproduces the input exactly.
[[nodiscard]] std::vector<std::string_view> split_lines(
    const std::string_view source);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

// Number of code points in a UTF-8 buffer (continuation bytes not counted).
[[nodiscard]] std::size_t utf8_length(const std::string_view sv) noexcept;

// Rejects truncated sequences, stray continuation bytes, overlong forms,
// surrogates and code points above U+10FFFF.
[[nodiscard]] bool is_valid_utf8(const std::string_view sv) noexcept;

[[nodiscard]] std::string to_upper_ascii(const std::string_view sv);

} // namespace mdstrip
