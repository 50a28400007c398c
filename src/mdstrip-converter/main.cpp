#include <mdstrip/converter.hpp>
#include <mdstrip/file_io.hpp>
#include <mdstrip/removal_ledger.hpp>
#include <mdstrip/removal_log.hpp>
#include <mdstrip/text_utils.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

struct cli_options
{
    bool verbose = false;
    bool debug = false;
    bool show_stripped = false;
    bool help = false;
    std::vector<std::string_view> positional;
};

constexpr std::string_view usage_text = R"(usage: mdstrip-converter [-h] [-v] [-d] [-s] [input_file output_file]

Convert Markdown files to cleaned plain text.
Without file arguments, reads standard input and writes standard output.

options:
  -h, --help           show this help message and exit
  -v, --verbose        show processing information
  -d, --debug          show detailed step-by-step conversion statistics
  -s, --show-stripped  save all stripped content to [output stem]_removed.txt
)";

[[nodiscard]] std::ostream& cli_error_stream()
{
    return std::cerr << "((MDSTRIP ERROR)): ";
}

[[nodiscard]] bool parse_cli_options(
    const int argc, char** argv, cli_options& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            options.help = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "-d" || arg == "--debug")
        {
            options.debug = true;
        }
        else if (arg == "-s" || arg == "--show-stripped")
        {
            options.show_stripped = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            cli_error_stream() << "Unrecognized option '" << arg << "'\n\n"
                               << usage_text;
            return false;
        }
        else
        {
            options.positional.push_back(arg);
        }
    }

    if (options.positional.size() != 0 && options.positional.size() != 2)
    {
        cli_error_stream() << "Expected both an input and an output file\n\n"
                           << usage_text;
        return false;
    }

    if (options.show_stripped && options.positional.empty())
    {
        cli_error_stream() << "'--show-stripped' requires an output file\n\n";
        return false;
    }

    return true;
}

int convert_stdin_to_stdout(const cli_options& options)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string input_buffer;
    input_buffer.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        input_buffer.append(line_buffer);
        input_buffer.append(1, '\n');
    }

    if (!mdstrip::is_valid_utf8(input_buffer))
    {
        cli_error_stream() << "Unable to read standard input - encoding "
                              "issue: input is not valid UTF-8\n";
        return 1;
    }

    // Debug statistics go to stderr so that stdout only holds the text.
    mdstrip::converter converter{std::cerr, std::cerr};

    const mdstrip::converter::config cfg{.emit_debug = options.debug};
    std::cout << converter.convert(cfg, input_buffer) << std::endl;

    return 0;
}

int convert_file(const cli_options& options)
{
    const std::filesystem::path input_path{options.positional[0]};
    const std::filesystem::path output_path{options.positional[1]};

    std::error_code ec;

    if (!std::filesystem::exists(input_path, ec))
    {
        cli_error_stream() << "Input file '" << input_path.string()
                           << "' does not exist.\n";
        return 1;
    }

    if (!std::filesystem::is_regular_file(input_path, ec))
    {
        cli_error_stream() << "'" << input_path.string()
                           << "' is not a regular file.\n";
        return 1;
    }

    if (output_path.has_parent_path())
    {
        std::filesystem::create_directories(output_path.parent_path(), ec);

        if (ec)
        {
            cli_error_stream() << "File system error: " << ec.message()
                               << '\n';
            return 1;
        }
    }

    const std::filesystem::path removed_path =
        output_path.parent_path() /
        (output_path.stem().string() + "_removed.txt");

    if (options.verbose)
    {
        std::cout << "Reading markdown from: " << input_path.string() << '\n';
    }

    std::string markdown;
    if (!mdstrip::read_file_in_buffer(input_path, markdown, std::cerr))
    {
        return 1;
    }

    if (!mdstrip::is_valid_utf8(markdown))
    {
        cli_error_stream() << "Unable to read file '" << input_path.string()
                           << "' - encoding issue: input is not valid UTF-8\n";
        return 1;
    }

    if (options.verbose)
    {
        std::cout << "Converting markdown to plain text...\n";
    }

    mdstrip::removal_ledger ledger;
    mdstrip::converter converter{std::cerr, std::cout};

    const mdstrip::converter::config cfg{.emit_debug = options.debug};
    const std::string cleaned = converter.convert(
        cfg, markdown, options.show_stripped ? &ledger : nullptr);

    if (options.verbose)
    {
        std::cout << "Writing cleaned text to: " << output_path.string()
                  << '\n';
    }

    if (!mdstrip::write_buffer_to_file(output_path, cleaned, std::cerr))
    {
        return 1;
    }

    if (options.show_stripped)
    {
        if (!mdstrip::save_removal_log(removed_path, ledger, std::cerr))
        {
            return 1;
        }

        if (options.verbose)
        {
            std::cout << "Stripped content saved to: "
                      << removed_path.string() << '\n';
        }
    }

    if (options.verbose)
    {
        std::cout << "Successfully converted "
                  << mdstrip::utf8_length(markdown) << " characters to "
                  << mdstrip::utf8_length(cleaned) << " characters\n";
    }

    std::cout << "Conversion complete: " << input_path.string() << " -> "
              << output_path.string() << '\n';

    if (options.show_stripped)
    {
        std::cout << "Stripped content logged to: " << removed_path.string()
                  << '\n';
    }

    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    cli_options options;

    if (!parse_cli_options(argc, argv, options))
    {
        return 1;
    }

    if (options.help)
    {
        std::cout << usage_text;
        return 0;
    }

    if (options.positional.empty())
    {
        return convert_stdin_to_stdout(options);
    }

    return convert_file(options);
}
