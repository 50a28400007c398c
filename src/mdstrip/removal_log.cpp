#include "removal_log.hpp"

#include "file_io.hpp"
#include "removal_ledger.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <sstream>
#include <string>

namespace mdstrip {

namespace {

constexpr std::size_t banner_width = 50;

} // namespace

void write_removal_log(std::ostream& os, const removal_ledger& ledger)
{
    const std::string banner(banner_width, '=');

    os << "MARKDOWN CONVERTER - REMOVED CONTENT LOG\n" << banner << "\n\n";

    for (const removal_ledger::category& c : ledger.categories())
    {
        os << to_upper_ascii(c._name) << '\n'
           << std::string(c._name.size(), '-') << '\n';

        for (std::size_t i = 0; i < c._fragments.size(); ++i)
        {
            os << "\n[Item " << (i + 1) << "]\n" << c._fragments[i] << '\n';
        }

        os << '\n' << banner << "\n\n";
    }
}

bool save_removal_log(const std::filesystem::path& path,
    const removal_ledger& ledger, std::ostream& err_stream)
{
    if (ledger.empty())
    {
        return true;
    }

    std::ostringstream oss;
    write_removal_log(oss, ledger);

    return write_buffer_to_file(path, oss.str(), err_stream);
}

} // namespace mdstrip
