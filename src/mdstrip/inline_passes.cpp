#include "pass_helpers.hpp"
#include "passes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mdstrip {

namespace {

// `*x*` or `_x_`, rejected when the delimiter touches another copy of itself
// on either side, so that the halves of `**x**` are never taken as italics.
[[nodiscard]] std::optional<span_match> match_italic(
    const std::string_view source, const std::size_t idx, const char delim,
    const std::size_t max_span) noexcept
{
    if (idx > 0 && source[idx - 1] == delim)
    {
        return std::nullopt;
    }

    const std::optional<span_match> m =
        match_delimited(source, idx, std::string_view{&delim, 1}, max_span);

    if (!m.has_value() ||
        (m->_end < source.size() && source[m->_end] == delim))
    {
        return std::nullopt;
    }

    return m;
}

// Number of consecutive backslashes ending right before `end`.
[[nodiscard]] std::size_t backslash_run_before(
    const std::string_view source, std::size_t end) noexcept
{
    std::size_t n = 0;
    while (end > 0 && source[end - 1] == '\\')
    {
        ++n;
        --end;
    }

    return n;
}

// An odd run of backslashes before either delimiter makes it literal text,
// left for the escape pass. An even run is a sequence of escaped backslashes.
[[nodiscard]] std::optional<span_match> unless_escaped(
    const std::string_view source, const std::size_t idx,
    const std::optional<span_match>& m) noexcept
{
    if (!m.has_value())
    {
        return std::nullopt;
    }

    if (backslash_run_before(source, idx) % 2 == 1 ||
        backslash_run_before(m->_replacement, m->_replacement.size()) % 2 ==
            1)
    {
        return std::nullopt;
    }

    return m;
}

// `[label](target)`, optionally prefixed by `!`. The label may be empty only
// for images.
[[nodiscard]] std::optional<span_match> match_link(
    const std::string_view source, const std::size_t idx, const bool image,
    const std::size_t max_span) noexcept
{
    std::size_t i = idx;

    if (image)
    {
        if (source[i] != '!')
        {
            return std::nullopt;
        }

        ++i;
    }

    if (i >= source.size() || source[i] != '[')
    {
        return std::nullopt;
    }

    const std::size_t label_begin = i + 1;
    const std::size_t label_end =
        scan_until(source, label_begin, ']', max_span);
    const std::size_t label_len = label_end - label_begin;

    if ((!image && label_len == 0) || label_len > max_span ||
        source.substr(label_end, 2) != "](")
    {
        return std::nullopt;
    }

    const std::size_t target_begin = label_end + 2;
    const std::size_t target_end =
        scan_until(source, target_begin, ')', max_span);
    const std::size_t target_len = target_end - target_begin;

    if (target_len == 0 || target_len > max_span ||
        target_end >= source.size() || source[target_end] != ')')
    {
        return std::nullopt;
    }

    return span_match{._end = target_end + 1,
        ._replacement = source.substr(label_begin, label_len)};
}

[[nodiscard]] std::string remove_emphasis_in_line(
    const std::string_view line, const pass_context& ctx)
{
    const std::size_t max_span = ctx.max_span();

    const auto delimited = [max_span](const std::string_view delim)
    {
        return [delim, max_span](
                   const std::string_view s, const std::size_t idx)
        {
            return unless_escaped(
                s, idx, match_delimited(s, idx, delim, max_span));
        };
    };

    const auto italic = [max_span](const char delim)
    {
        return [delim, max_span](
                   const std::string_view s, const std::size_t idx)
        {
            return unless_escaped(
                s, idx, match_italic(s, idx, delim, max_span));
        };
    };

    std::string result{line};
    result = rewrite_spans(result, ctx, "bold_italic", delimited("***"));
    result = rewrite_spans(result, ctx, "bold_asterisks", delimited("**"));
    result = rewrite_spans(result, ctx, "bold_underscores", delimited("__"));
    result = rewrite_spans(result, ctx, "italic_asterisks", italic('*'));
    result = rewrite_spans(result, ctx, "italic_underscores", italic('_'));
    return result;
}

} // namespace

std::string remove_inline_code(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_spans(source, ctx, "inline_code",
        [&](const std::string_view s, const std::size_t idx)
        { return match_delimited(s, idx, "`", ctx.max_span()); });
}

std::string remove_emphasis(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        { return remove_emphasis_in_line(line, ctx); });
}

std::string remove_images_and_links(
    const std::string_view source, const pass_context& ctx)
{
    const std::size_t max_span = ctx.max_span();

    return rewrite_lines(source,
        [&](const std::string_view line) -> std::optional<std::string>
        {
            const std::string without_images = rewrite_spans(line, ctx,
                "images",
                [max_span](const std::string_view s, const std::size_t idx)
                { return match_link(s, idx, true /* image */, max_span); });

            return rewrite_spans(without_images, ctx, "links",
                [max_span](const std::string_view s, const std::size_t idx)
                { return match_link(s, idx, false /* image */, max_span); });
        });
}

std::string remove_strikethrough(
    const std::string_view source, const pass_context& ctx)
{
    return rewrite_spans(source, ctx, "strikethrough",
        [&](const std::string_view s, const std::size_t idx)
        { return match_delimited(s, idx, "~~", ctx.max_span()); });
}

std::string remove_footnote_references(
    const std::string_view source, const pass_context& ctx)
{
    const std::size_t max_span = ctx.max_span();

    return rewrite_spans(source, ctx, "footnote_references",
        [max_span](const std::string_view s,
            const std::size_t idx) -> std::optional<span_match>
        {
            if (s.substr(idx, 2) != "[^")
            {
                return std::nullopt;
            }

            const std::size_t id_begin = idx + 2;
            const std::size_t id_end = scan_until(s, id_begin, ']', max_span);
            const std::size_t id_len = id_end - id_begin;

            if (id_len == 0 || id_len > max_span || id_end >= s.size() ||
                s[id_end] != ']')
            {
                return std::nullopt;
            }

            // `[^id]:` starts a definition, handled separately.
            if (id_end + 1 < s.size() && s[id_end + 1] == ':')
            {
                return std::nullopt;
            }

            return span_match{._end = id_end + 1, ._replacement = {}};
        });
}

} // namespace mdstrip
