#pragma once

#include "passes.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mdstrip {

struct span_match
{
    std::size_t _end; // One past the last character of the span.
    std::string_view _replacement;
};

// Scans `source` left to right, calling `match_at(source, idx)` at every
// position. A successful match is logged under `category` and replaced; a
// failed one copies a single character and retries at the next position.
// Every matcher is bounded by the maximum span, so the scan is linear.
template <typename FMatch>
[[nodiscard]] std::string rewrite_spans(const std::string_view source,
    const pass_context& ctx, const std::string_view category,
    FMatch&& match_at)
{
    std::string result;
    result.reserve(source.size());

    std::size_t idx = 0;
    while (idx < source.size())
    {
        const std::optional<span_match> m = match_at(source, idx);

        if (!m.has_value())
        {
            result.append(1, source[idx]);
            ++idx;
            continue;
        }

        ctx.log(category, source.substr(idx, m->_end - idx));
        result.append(m->_replacement);
        idx = m->_end;
    }

    return result;
}

// Calls `f(line)` for every line of `source`. Returning `std::nullopt` drops
// the line from the output.
template <typename F>
[[nodiscard]] std::string rewrite_lines(const std::string_view source, F&& f)
{
    const std::vector<std::string_view> lines = split_lines(source);

    std::vector<std::string> result;
    result.reserve(lines.size());

    for (const std::string_view line : lines)
    {
        std::optional<std::string> rewritten = f(line);

        if (rewritten.has_value())
        {
            result.emplace_back(std::move(*rewritten));
        }
    }

    return join_lines(result);
}

// Index one past a run of at most `max_len + 1` characters starting at
// `begin` that are neither `stop` nor a newline.
[[nodiscard]] std::size_t scan_until(const std::string_view source,
    const std::size_t begin, const char stop,
    const std::size_t max_len) noexcept;

// Matches `delim interior delim` at `idx`, where the interior holds between
// 1 and `max_span` characters, none a newline or `delim.front()`.
[[nodiscard]] std::optional<span_match> match_delimited(
    const std::string_view source, const std::size_t idx,
    const std::string_view delim, const std::size_t max_span) noexcept;

// Index of the content following a list or checkbox marker: whitespace from
// `begin` is skipped, but at least one character is always left.
// Returns `std::nullopt` if nothing follows `begin`.
[[nodiscard]] std::optional<std::size_t> skip_space_keep_one(
    const std::string_view line, const std::size_t begin) noexcept;

} // namespace mdstrip
