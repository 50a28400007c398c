#include "text_utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdstrip {

std::string_view trim_left(const std::string_view sv) noexcept
{
    std::size_t begin = 0;

    while (begin < sv.size() && is_space(sv[begin]))
    {
        ++begin;
    }

    return sv.substr(begin);
}

std::string_view trim(const std::string_view sv) noexcept
{
    const std::string_view left_trimmed = trim_left(sv);
    std::size_t end = left_trimmed.size();

    while (end > 0 && is_space(left_trimmed[end - 1]))
    {
        --end;
    }

    return left_trimmed.substr(0, end);
}

bool is_blank(const std::string_view sv) noexcept
{
    return trim(sv).empty();
}

std::vector<std::string_view> split_lines(const std::string_view source)
{
    std::vector<std::string_view> result;

    std::size_t line_start = 0;
    for (std::size_t i = 0; i < source.size(); ++i)
    {
        if (source[i] == '\n')
        {
            result.emplace_back(source.substr(line_start, i - line_start));
            line_start = i + 1;
        }
    }

    result.emplace_back(source.substr(line_start));
    return result;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::size_t total_size = lines.size();
    for (const std::string& line : lines)
    {
        total_size += line.size();
    }

    std::string result;
    result.reserve(total_size);

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i != 0)
        {
            result.append(1, '\n');
        }

        result.append(lines[i]);
    }

    return result;
}

std::size_t utf8_length(const std::string_view sv) noexcept
{
    std::size_t result = 0;

    for (const char c : sv)
    {
        if ((static_cast<unsigned char>(c) & 0xC0u) != 0x80u)
        {
            ++result;
        }
    }

    return result;
}

bool is_valid_utf8(const std::string_view sv) noexcept
{
    std::size_t i = 0;

    while (i < sv.size())
    {
        const auto lead = static_cast<unsigned char>(sv[i]);

        if (lead < 0x80u)
        {
            ++i;
            continue;
        }

        std::size_t n_continuation = 0;
        char32_t code_point = 0;

        if ((lead & 0xE0u) == 0xC0u)
        {
            n_continuation = 1;
            code_point = lead & 0x1Fu;
        }
        else if ((lead & 0xF0u) == 0xE0u)
        {
            n_continuation = 2;
            code_point = lead & 0x0Fu;
        }
        else if ((lead & 0xF8u) == 0xF0u)
        {
            n_continuation = 3;
            code_point = lead & 0x07u;
        }
        else
        {
            return false;
        }

        if (i + n_continuation >= sv.size())
        {
            return false;
        }

        for (std::size_t j = 1; j <= n_continuation; ++j)
        {
            const auto c = static_cast<unsigned char>(sv[i + j]);
            if ((c & 0xC0u) != 0x80u)
            {
                return false;
            }

            code_point = (code_point << 6) | (c & 0x3Fu);
        }

        constexpr char32_t min_by_length[4] = {0, 0x80, 0x800, 0x10000};

        if (code_point < min_by_length[n_continuation] ||
            code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF))
        {
            return false;
        }

        i += n_continuation + 1;
    }

    return true;
}

std::string to_upper_ascii(const std::string_view sv)
{
    std::string result{sv};

    for (char& c : result)
    {
        if (c >= 'a' && c <= 'z')
        {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }

    return result;
}

} // namespace mdstrip
