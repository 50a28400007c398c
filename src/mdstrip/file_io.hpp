#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace mdstrip {

[[nodiscard]] std::ostream& error_diagnostic_stream(
    std::ostream& err_stream, const char* type);

// Replaces the contents of `buffer` with the whole file.
[[nodiscard]] bool read_file_in_buffer(const std::filesystem::path& path,
    std::string& buffer, std::ostream& err_stream);

[[nodiscard]] bool write_buffer_to_file(const std::filesystem::path& path,
    const std::string_view buffer, std::ostream& err_stream);

} // namespace mdstrip
