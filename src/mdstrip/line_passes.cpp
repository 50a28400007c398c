#include "pass_helpers.hpp"
#include "passes.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mdstrip {

namespace {

[[nodiscard]] bool is_fence_line(const std::string_view line) noexcept
{
    return trim(line).substr(0, 3) == "```";
}

[[nodiscard]] bool is_rule_symbol(const char c) noexcept
{
    return c == '-' || c == '*' || c == '_';
}

// Leading `>` markers, each optionally followed by whitespace, preceded by
// optional whitespace. Returns the prefix length and the marker count.
struct quote_prefix
{
    std::size_t _length;
    std::size_t _n_markers;
};

[[nodiscard]] quote_prefix scan_quote_prefix(
    const std::string_view line) noexcept
{
    std::size_t i = 0;
    while (i < line.size() && is_space(line[i]))
    {
        ++i;
    }

    std::size_t n_markers = 0;
    while (i < line.size() && line[i] == '>')
    {
        ++n_markers;
        ++i;

        while (i < line.size() && is_space(line[i]))
        {
            ++i;
        }
    }

    if (n_markers == 0)
    {
        return quote_prefix{._length = 0, ._n_markers = 0};
    }

    return quote_prefix{._length = i, ._n_markers = n_markers};
}

} // namespace

std::string remove_code_blocks(
    const std::string_view source, const pass_context& ctx)
{
    const std::vector<std::string_view> lines = split_lines(source);

    std::vector<std::string> result;
    result.reserve(lines.size());

    bool in_code_block = false;
    std::size_t block_start_line = 0;
    std::string current_block;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string_view line = lines[i];

        if (is_fence_line(line))
        {
            if (!in_code_block)
            {
                in_code_block = true;
                block_start_line = i;

                current_block.assign(line);
                result.emplace_back(code_block_placeholder);
            }
            else
            {
                current_block.append(1, '\n');
                current_block.append(line);

                ctx.log("code_blocks", current_block);

                in_code_block = false;
                current_block.clear();
            }

            continue;
        }

        if (in_code_block)
        {
            current_block.append(1, '\n');
            current_block.append(line);
            continue;
        }

        result.emplace_back(line);
    }

    if (in_code_block)
    {
        ctx.warning_diagnostic_stream()
            << "Unclosed code block starting at line "
            << (block_start_line + 1) << "\n\n";

        ctx.log("code_blocks_unclosed", current_block);
    }

    return join_lines(result);
}

std::string remove_blockquotes(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            const auto [prefix_len, n_markers] = scan_quote_prefix(line);

            if (n_markers == 0)
            {
                return std::string{line};
            }

            ctx.log("blockquotes", line.substr(0, prefix_len));

            std::string rewritten(n_markers + 1, ' ');
            rewritten.append(line.substr(prefix_len));
            return rewritten;
        });
}

std::string remove_horizontal_rules(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            const std::string_view trimmed = trim(line);

            if (trimmed.empty() || !is_rule_symbol(trimmed.front()))
            {
                return std::string{line};
            }

            const char symbol = trimmed.front();
            for (const char c : trimmed)
            {
                if (c != symbol && c != ' ' && c != '\t')
                {
                    return std::string{line};
                }
            }

            ctx.log("horizontal_rules", line);
            return std::nullopt;
        });
}

std::string remove_html_tags(
    const std::string_view source, const pass_context& ctx)
{
    const auto match_tag =
        [&](const std::string_view line,
            const std::size_t idx) -> std::optional<span_match>
    {
        if (line[idx] != '<')
        {
            return std::nullopt;
        }

        const std::size_t close_idx =
            scan_until(line, idx + 1, '>', ctx.max_span());

        if (close_idx - (idx + 1) > ctx.max_span() ||
            close_idx >= line.size() || line[close_idx] != '>')
        {
            return std::nullopt;
        }

        return span_match{._end = close_idx + 1, ._replacement = {}};
    };

    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        { return rewrite_spans(line, ctx, "html_tags", match_tag); });
}

} // namespace mdstrip
