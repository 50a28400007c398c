#pragma once

#include <filesystem>
#include <iosfwd>

namespace mdstrip {

class removal_ledger;

void write_removal_log(std::ostream& os, const removal_ledger& ledger);

// Writes nothing and succeeds if `ledger` is empty.
[[nodiscard]] bool save_removal_log(const std::filesystem::path& path,
    const removal_ledger& ledger, std::ostream& err_stream);

} // namespace mdstrip
