#include "file_io.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

namespace mdstrip {

std::ostream& error_diagnostic_stream(
    std::ostream& err_stream, const char* type)
{
    return err_stream << "((MDSTRIP " << type << " ERROR)): ";
}

bool read_file_in_buffer(const std::filesystem::path& path,
    std::string& buffer, std::ostream& err_stream)
{
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        error_diagnostic_stream(err_stream, "IO")
            << "Failed to open file '" << path.string() << "'\n\n";

        return false;
    }

    const auto size = static_cast<std::streamsize>(ifs.tellg());
    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(static_cast<std::size_t>(size));

    if (!ifs.read(buffer.data(), size))
    {
        error_diagnostic_stream(err_stream, "IO")
            << "Failed to read file '" << path.string() << "'\n\n";

        return false;
    }

    return true;
}

bool write_buffer_to_file(const std::filesystem::path& path,
    const std::string_view buffer, std::ostream& err_stream)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        error_diagnostic_stream(err_stream, "IO")
            << "Failed to open file '" << path.string()
            << "' for writing\n\n";

        return false;
    }

    ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    ofs.flush();

    if (!ofs)
    {
        error_diagnostic_stream(err_stream, "IO")
            << "Failed to write file '" << path.string() << "'\n\n";

        return false;
    }

    return true;
}

} // namespace mdstrip
