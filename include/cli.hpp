/**
 * Command-line options for stockholm_info
 */

#ifndef STOCKHOLM_CLI_HPP
#define STOCKHOLM_CLI_HPP

#include "logging.hpp"
#include "output_writer.hpp"
#include "stockholm_reader.hpp"
#include <string>
#include <vector>

namespace stockholm {

struct CliOptions {
    std::string input_path;
    std::string output_path = "-";
    OutputFormat format = OutputFormat::SUMMARY;
    ReaderConfig reader;
    LogLevel log_level = LogLevel::INFO;
    bool sniff_only = false;
    bool show_help = false;
};

/**
 * Parse arguments (excluding the program name)
 * Later options override earlier ones, so "--options" can be combined with
 * the individual flags.
 * @throws std::invalid_argument for unknown options, missing values or a
 *         missing input path
 */
CliOptions parse_cli_args(const std::vector<std::string>& args);
CliOptions parse_cli_args(int argc, char* argv[]);

void print_usage(const char* program_name);

} // namespace stockholm

#endif // STOCKHOLM_CLI_HPP
