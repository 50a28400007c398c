#include "pass_helpers.hpp"
#include "passes.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdstrip {

namespace {

[[nodiscard]] bool is_unordered_marker(const char c) noexcept
{
    return c == '-' || c == '*' || c == '+';
}

[[nodiscard]] bool is_checkbox_state(const char c) noexcept
{
    return c == ' ' || c == 'x' || c == 'X';
}

[[nodiscard]] bool is_unescapable(const char c) noexcept
{
    constexpr std::string_view markup_punctuation = "\\`*_{}[]()#+-.!";
    return markup_punctuation.find(c) != std::string_view::npos;
}

[[nodiscard]] std::size_t skip_space(
    const std::string_view line, std::size_t i) noexcept
{
    while (i < line.size() && is_space(line[i]))
    {
        ++i;
    }

    return i;
}

// `=+` or `-+`, optionally followed by whitespace.
[[nodiscard]] bool is_header_underline(const std::string_view line) noexcept
{
    if (line.empty() || (line.front() != '=' && line.front() != '-'))
    {
        return false;
    }

    std::size_t i = 0;
    while (i < line.size() && line[i] == line.front())
    {
        ++i;
    }

    return skip_space(line, i) == line.size();
}

// Position right after `[label]:` at the start of `line`, or `std::nullopt`.
[[nodiscard]] std::optional<std::size_t> match_bracket_definition(
    const std::string_view line) noexcept
{
    if (line.empty() || line.front() != '[')
    {
        return std::nullopt;
    }

    const std::size_t close_idx = line.find(']', 1);
    if (close_idx == std::string_view::npos || close_idx == 1 ||
        line.substr(close_idx, 2) != "]:")
    {
        return std::nullopt;
    }

    return close_idx + 2;
}

// Index of the first character after the list marker and its trailing
// whitespace, or `std::nullopt` if `line` is not a list item. The content
// after the marker must be non-empty.
[[nodiscard]] std::optional<std::size_t> match_unordered_marker(
    const std::string_view line) noexcept
{
    const std::size_t marker_idx = skip_space(line, 0);

    if (marker_idx >= line.size() || !is_unordered_marker(line[marker_idx]))
    {
        return std::nullopt;
    }

    const std::size_t after_marker = marker_idx + 1;
    if (after_marker >= line.size() || !is_space(line[after_marker]))
    {
        return std::nullopt;
    }

    return skip_space_keep_one(line, after_marker + 1);
}

[[nodiscard]] std::optional<std::size_t> match_ordered_marker(
    const std::string_view line) noexcept
{
    const std::size_t digits_begin = skip_space(line, 0);

    std::size_t i = digits_begin;
    while (i < line.size() && is_digit(line[i]))
    {
        ++i;
    }

    if (i == digits_begin || i >= line.size() || line[i] != '.')
    {
        return std::nullopt;
    }

    const std::size_t after_dot = i + 1;
    if (after_dot >= line.size() || !is_space(line[after_dot]))
    {
        return std::nullopt;
    }

    return skip_space_keep_one(line, after_dot + 1);
}

template <typename FMatchMarker>
[[nodiscard]] std::string strip_markers(const std::string_view source,
    const pass_context& ctx, const std::string_view category,
    FMatchMarker&& match_marker)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            const std::optional<std::size_t> content_idx = match_marker(line);

            if (!content_idx.has_value())
            {
                return std::string{line};
            }

            ctx.log(category, line.substr(0, *content_idx));
            return std::string{line.substr(*content_idx)};
        });
}

} // namespace

std::string remove_hash_headers(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            std::size_t n_hashes = 0;
            while (n_hashes < line.size() && line[n_hashes] == '#')
            {
                ++n_hashes;
            }

            if (n_hashes == 0 || n_hashes > 6 || n_hashes >= line.size() ||
                !is_space(line[n_hashes]))
            {
                return std::string{line};
            }

            ctx.log("hash_headers", line);
            return std::string{line.substr(skip_space(line, n_hashes))};
        });
}

std::string remove_underline_headers(
    const std::string_view source, const pass_context& ctx)
{
    const std::vector<std::string_view> lines = split_lines(source);

    std::vector<std::string> result;
    result.reserve(lines.size());

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        result.emplace_back(lines[i]);

        if (i + 1 < lines.size() && is_header_underline(lines[i + 1]))
        {
            ctx.log("underline_headers", lines[i + 1]);
            ++i;
        }
    }

    return join_lines(result);
}

std::string remove_reference_links(
    const std::string_view source, const pass_context& ctx)
{
    const std::string without_definitions = rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            // `[^id]:` lines are footnote definitions.
            if (line.substr(0, 2) == "[^" ||
                !match_bracket_definition(line).has_value())
            {
                return std::string{line};
            }

            ctx.log("reference_link_definitions", line);
            return std::string{};
        });

    const std::size_t max_span = ctx.max_span();

    return rewrite_spans(without_definitions, ctx, "reference_links",
        [max_span](const std::string_view s,
            const std::size_t idx) -> std::optional<span_match>
        {
            if (s[idx] != '[')
            {
                return std::nullopt;
            }

            const std::size_t text_begin = idx + 1;
            const std::size_t text_end =
                scan_until(s, text_begin, ']', max_span);
            const std::size_t text_len = text_end - text_begin;

            if (text_len == 0 || text_len > max_span ||
                s.substr(text_end, 2) != "][")
            {
                return std::nullopt;
            }

            const std::size_t ref_begin = text_end + 2;
            const std::size_t ref_end = scan_until(s, ref_begin, ']', max_span);

            if (ref_end - ref_begin > max_span || ref_end >= s.size() ||
                s[ref_end] != ']')
            {
                return std::nullopt;
            }

            return span_match{._end = ref_end + 1,
                ._replacement = s.substr(text_begin, text_len)};
        });
}

std::string remove_task_lists(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            const std::size_t marker_idx = skip_space(line, 0);

            if (marker_idx + 1 >= line.size() ||
                !is_unordered_marker(line[marker_idx]) ||
                !is_space(line[marker_idx + 1]))
            {
                return std::string{line};
            }

            const std::size_t box_idx = skip_space(line, marker_idx + 1);
            if (line.size() - box_idx < 3 || line[box_idx] != '[' ||
                !is_checkbox_state(line[box_idx + 1]) ||
                line[box_idx + 2] != ']')
            {
                return std::string{line};
            }

            const std::optional<std::size_t> text_idx =
                skip_space_keep_one(line, box_idx + 3);

            if (!text_idx.has_value())
            {
                return std::string{line};
            }

            ctx.log("task_lists", line);
            return std::string{line.substr(*text_idx)};
        });
}

std::string remove_list_markers(
    const std::string_view source, const pass_context& ctx)
{
    const std::string without_unordered =
        strip_markers(source, ctx, "unordered_lists", &match_unordered_marker);

    return strip_markers(
        without_unordered, ctx, "ordered_lists", &match_ordered_marker);
}

std::string resolve_escapes_once(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_spans(source, ctx, "escaped_characters",
        [](const std::string_view s,
            const std::size_t idx) -> std::optional<span_match>
        {
            if (s[idx] != '\\' || idx + 1 >= s.size() ||
                !is_unescapable(s[idx + 1]))
            {
                return std::nullopt;
            }

            return span_match{
                ._end = idx + 2, ._replacement = s.substr(idx + 1, 1)};
        });
}

std::string resolve_escapes(
    const std::string_view source, const pass_context& ctx)
{
    const std::string once = resolve_escapes_once(source, ctx);
    return resolve_escapes_once(once, ctx);
}

std::string remove_table_separators(
    const std::string_view source, const pass_context& ctx)
{
    const auto is_alignment_cell = [](const std::string_view cell)
    {
        std::size_t begin = 0;
        std::size_t end = cell.size();

        if (begin < end && cell[begin] == ':')
        {
            ++begin;
        }

        if (begin < end && cell[end - 1] == ':')
        {
            --end;
        }

        if (begin >= end)
        {
            return false;
        }

        for (std::size_t i = begin; i < end; ++i)
        {
            if (cell[i] != '-')
            {
                return false;
            }
        }

        return true;
    };

    const auto is_separator_row = [&](const std::string_view line)
    {
        const std::string_view trimmed = trim(line);

        if (trimmed.size() < 2 || trimmed.front() != '|' ||
            trimmed.back() != '|')
        {
            return false;
        }

        const std::string_view interior =
            trimmed.substr(1, trimmed.size() - 2);

        bool has_dash = false;
        for (const char c : interior)
        {
            if (c == '-')
            {
                has_dash = true;
            }
            else if (c != ':' && c != '|' && !is_space(c))
            {
                return false;
            }
        }

        if (!has_dash)
        {
            return false;
        }

        std::size_t n_cells = 0;
        std::size_t cell_begin = 0;

        while (cell_begin <= interior.size())
        {
            std::size_t cell_end = interior.find('|', cell_begin);
            if (cell_end == std::string_view::npos)
            {
                cell_end = interior.size();
            }

            const std::string_view cell =
                trim(interior.substr(cell_begin, cell_end - cell_begin));

            if (!cell.empty())
            {
                if (!is_alignment_cell(cell))
                {
                    return false;
                }

                ++n_cells;
            }

            cell_begin = cell_end + 1;
        }

        return n_cells >= 2;
    };

    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            if (!is_separator_row(line))
            {
                return std::string{line};
            }

            ctx.log("table_separators", line);
            return std::nullopt;
        });
}

std::string remove_footnote_definitions(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            if (line.substr(0, 2) != "[^")
            {
                return std::string{line};
            }

            const std::optional<std::size_t> body_idx =
                match_bracket_definition(line);

            // The id must be non-empty and a body must follow the colon.
            if (!body_idx.has_value() || *body_idx == 4 ||
                *body_idx >= line.size())
            {
                return std::string{line};
            }

            ctx.log("footnote_definitions", line);
            return std::string{};
        });
}

std::string remove_footnotes(
    const std::string_view source, const pass_context& ctx)
{
    const std::string without_references =
        remove_footnote_references(source, ctx);

    return remove_footnote_definitions(without_references, ctx);
}

} // namespace mdstrip
