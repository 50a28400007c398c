#include "pass_helpers.hpp"

#include "passes.hpp"
#include "removal_ledger.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace mdstrip {

pass_context::pass_context(removal_ledger* ledger, std::ostream& err_stream,
    const std::size_t max_span) noexcept
    : _ledger{ledger}, _err_stream{err_stream}, _max_span{max_span}
{}

void pass_context::log(
    const std::string_view category, const std::string_view fragment) const
{
    if (_ledger == nullptr)
    {
        return;
    }

    _ledger->log(category, fragment);
}

std::ostream& pass_context::warning_diagnostic_stream() const
{
    return _err_stream << "((MDSTRIP WARNING)): ";
}

std::size_t pass_context::max_span() const noexcept
{
    return _max_span;
}

// ----------------------------------------------------------------------------

std::size_t scan_until(const std::string_view source, const std::size_t begin,
    const char stop, const std::size_t max_len) noexcept
{
    std::size_t i = begin;

    while (i < source.size() && source[i] != stop && source[i] != '\n' &&
           i - begin <= max_len)
    {
        ++i;
    }

    return i;
}

std::optional<span_match> match_delimited(const std::string_view source,
    const std::size_t idx, const std::string_view delim,
    const std::size_t max_span) noexcept
{
    if (source.substr(idx, delim.size()) != delim)
    {
        return std::nullopt;
    }

    const std::size_t interior_begin = idx + delim.size();
    const std::size_t interior_end =
        scan_until(source, interior_begin, delim.front(), max_span);

    const std::size_t interior_len = interior_end - interior_begin;
    if (interior_len == 0 || interior_len > max_span)
    {
        return std::nullopt;
    }

    if (source.substr(interior_end, delim.size()) != delim)
    {
        return std::nullopt;
    }

    return span_match{._end = interior_end + delim.size(),
        ._replacement = source.substr(interior_begin, interior_len)};
}

std::optional<std::size_t> skip_space_keep_one(
    const std::string_view line, const std::size_t begin) noexcept
{
    if (begin >= line.size())
    {
        return std::nullopt;
    }

    std::size_t i = begin;
    while (i + 1 < line.size() && is_space(line[i]))
    {
        ++i;
    }

    return i;
}

} // namespace mdstrip
