#pragma once

#include "passes.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace mdstrip {

class removal_ledger;

class converter
{
private:
    std::ostream& _err_stream;
    std::ostream& _dbg_stream;

public:
    struct config
    {
        bool emit_debug = false;
        bool unwrap_json_input = true;
        std::size_t max_span = default_max_span;
    };

    [[nodiscard]] explicit converter(
        std::ostream& err_stream, std::ostream& dbg_stream);

    // Never fails: markup that cannot be recognized is left in place. When
    // `ledger` is not null, every removed fragment is recorded in it.
    [[nodiscard]] std::string convert(const config& cfg,
        const std::string_view source,
        removal_ledger* ledger = nullptr) noexcept;
};

} // namespace mdstrip
