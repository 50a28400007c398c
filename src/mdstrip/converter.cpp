#include "converter.hpp"

#include "passes.hpp"
#include "removal_ledger.hpp"
#include "text_utils.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace mdstrip {

namespace {

using pass_function = std::string (*)(std::string_view, const pass_context&);

struct pipeline_step
{
    std::string_view _name;
    pass_function _function;
};

// Each step assumes every construct handled by the previous steps is gone:
// reordering changes the output.
constexpr std::array<pipeline_step, 17> pipeline_steps{{
    {"Code blocks", &remove_code_blocks},                //
    {"Inline code", &remove_inline_code},                //
    {"Hash headers", &remove_hash_headers},              //
    {"Underline headers", &remove_underline_headers},    //
    {"All emphasis", &remove_emphasis},                  //
    {"Reference links", &remove_reference_links},        //
    {"Links and images", &remove_images_and_links},      //
    {"Task lists", &remove_task_lists},                  //
    {"Regular lists", &remove_list_markers},             //
    {"Escaped characters", &resolve_escapes},            //
    {"Blockquotes", &remove_blockquotes},                //
    {"Horizontal rules", &remove_horizontal_rules},      //
    {"Tables (conservative)", &remove_table_separators}, //
    {"HTML tags", &remove_html_tags},                    //
    {"Strikethrough", &remove_strikethrough},            //
    {"Footnotes", &remove_footnotes},                    //
    {"Clean whitespace", &normalize_whitespace}          //
}};

void replace_all(std::string& buffer, const std::string_view from,
    const std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = buffer.find(from, pos)) != std::string::npos)
    {
        buffer.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Payloads copied out of JSON look like `"content": "line\nline"`: keep the
// value, drop the quotes and undo the `\n` and `\"` escapes.
[[nodiscard]] bool looks_json_wrapped(const std::string_view source) noexcept
{
    return !source.empty() && source.front() == '"' &&
           source.find(':') != std::string_view::npos;
}

[[nodiscard]] std::string unwrap_json_input(const std::string_view source)
{
    std::string_view value = trim(source.substr(source.find(':') + 1));

    while (!value.empty() && value.front() == '"')
    {
        value.remove_prefix(1);
    }

    while (!value.empty() && value.back() == '"')
    {
        value.remove_suffix(1);
    }

    std::string result{value};
    replace_all(result, "\\n", "\n");
    replace_all(result, "\\\"", "\"");
    return result;
}

[[nodiscard]] long long signed_diff(
    const std::size_t before, const std::size_t after) noexcept
{
    return static_cast<long long>(before) - static_cast<long long>(after);
}

} // namespace

converter::converter(std::ostream& err_stream, std::ostream& dbg_stream)
    : _err_stream{err_stream}, _dbg_stream{dbg_stream}
{}

std::string converter::convert(const config& cfg,
    const std::string_view source, removal_ledger* ledger) noexcept
{
    std::string text = cfg.unwrap_json_input && looks_json_wrapped(source)
                           ? unwrap_json_input(source)
                           : std::string{source};

    const pass_context ctx{ledger, _err_stream, cfg.max_span};
    const std::size_t original_length = utf8_length(text);

    if (cfg.emit_debug)
    {
        _dbg_stream << "Starting conversion - original length: "
                    << original_length << '\n';
    }

    std::size_t current_length = original_length;

    for (std::size_t i = 0; i < pipeline_steps.size(); ++i)
    {
        const pipeline_step& step = pipeline_steps[i];
        std::string rewritten = step._function(text, ctx);

        if (cfg.emit_debug)
        {
            const std::size_t after_length = utf8_length(rewritten);

            _dbg_stream << "Step " << (i + 1) << " - " << step._name << ": "
                        << current_length << " -> " << after_length
                        << " (diff: "
                        << signed_diff(current_length, after_length) << ")\n";

            current_length = after_length;
        }

        text = std::move(rewritten);
    }

    if (cfg.emit_debug)
    {
        _dbg_stream << "Final length: " << current_length
                    << " (total reduction: "
                    << signed_diff(original_length, current_length) << ")\n";
    }

    return text;
}

} // namespace mdstrip
