#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace mdstrip {

class removal_ledger;

inline constexpr std::string_view code_block_placeholder = "[CODE BLOCK]";
inline constexpr std::size_t default_max_span = 125;

// State shared by every pass of a single conversion.
class pass_context
{
private:
    removal_ledger* _ledger;
    std::ostream& _err_stream;
    std::size_t _max_span;

public:
    [[nodiscard]] explicit pass_context(removal_ledger* ledger,
        std::ostream& err_stream,
        const std::size_t max_span = default_max_span) noexcept;

    // No-op when conversion runs without a ledger.
    void log(const std::string_view category,
        const std::string_view fragment) const;

    [[nodiscard]] std::ostream& warning_diagnostic_stream() const;

    [[nodiscard]] std::size_t max_span() const noexcept;
};

//
// Line-bounded scanners (`line_passes.cpp`)
// ----------------------------------------------------------------------------

[[nodiscard]] std::string remove_code_blocks(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_blockquotes(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_horizontal_rules(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_html_tags(
    const std::string_view source, const pass_context& ctx);

//
// Bounded-span passes (`inline_passes.cpp`)
// ----------------------------------------------------------------------------

[[nodiscard]] std::string remove_inline_code(
    const std::string_view source, const pass_context& ctx);

// Bold-italic, bold and italic, in that order, one line at a time.
[[nodiscard]] std::string remove_emphasis(
    const std::string_view source, const pass_context& ctx);

// Images first, then links. Only the label survives.
[[nodiscard]] std::string remove_images_and_links(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_strikethrough(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_footnote_references(
    const std::string_view source, const pass_context& ctx);

//
// Structural passes (`block_passes.cpp`)
// ----------------------------------------------------------------------------

[[nodiscard]] std::string remove_hash_headers(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_underline_headers(
    const std::string_view source, const pass_context& ctx);

// Definitions (`[label]: target`) first, then usages (`[text][ref]`).
[[nodiscard]] std::string remove_reference_links(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_task_lists(
    const std::string_view source, const pass_context& ctx);

// Unordered markers first, then ordered ones.
[[nodiscard]] std::string remove_list_markers(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string resolve_escapes_once(
    const std::string_view source, const pass_context& ctx);

// Exactly two applications of `resolve_escapes_once`.
[[nodiscard]] std::string resolve_escapes(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_table_separators(
    const std::string_view source, const pass_context& ctx);

[[nodiscard]] std::string remove_footnote_definitions(
    const std::string_view source, const pass_context& ctx);

// References first, then definitions.
[[nodiscard]] std::string remove_footnotes(
    const std::string_view source, const pass_context& ctx);

//
// Final pass (`normalizer.cpp`)
// ----------------------------------------------------------------------------

[[nodiscard]] std::string normalize_whitespace(
    const std::string_view source, const pass_context& ctx);

} // namespace mdstrip
