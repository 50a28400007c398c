#include "passes.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdstrip {

std::string normalize_whitespace(
    const std::string_view source, const pass_context& ctx)
{
    const std::vector<std::string_view> lines = split_lines(source);

    std::vector<std::string> trimmed_lines;
    trimmed_lines.reserve(lines.size());

    for (const std::string_view line : lines)
    {
        trimmed_lines.emplace_back(trim(line));
    }

    const std::string joined = join_lines(trimmed_lines);

    std::string result;
    result.reserve(joined.size());

    std::size_t n_excessive_runs = 0;
    std::size_t i = 0;

    while (i < joined.size())
    {
        if (joined[i] != '\n')
        {
            result.append(1, joined[i]);
            ++i;
            continue;
        }

        std::size_t run_end = i;
        while (run_end < joined.size() && joined[run_end] == '\n')
        {
            ++run_end;
        }

        const std::size_t run_len = run_end - i;
        if (run_len >= 3)
        {
            ++n_excessive_runs;
            result.append(2, '\n');
        }
        else
        {
            result.append(run_len, '\n');
        }

        i = run_end;
    }

    if (n_excessive_runs > 0)
    {
        ctx.log("excessive_whitespace",
            "Found " + std::to_string(n_excessive_runs) +
                " instances of 3+ consecutive newlines");
    }

    return std::string{trim(result)};
}

} // namespace mdstrip
