/**
 * stockholm_info - Main Entry Point
 *
 * Reads a Stockholm alignment and reports it as a summary, TSV or JSON.
 */

#include "cli.hpp"
#include "line_source.hpp"
#include "logging.hpp"
#include "output_writer.hpp"
#include "stockholm_reader.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    stockholm::CliOptions options;

    try {
        options = stockholm::parse_cli_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        stockholm::print_usage(argv[0]);
        return 1;
    }

    if (options.show_help) {
        stockholm::print_usage(argv[0]);
        return 0;
    }

    stockholm::set_log_level(options.log_level);

    try {
        if (options.sniff_only) {
            auto source = stockholm::open_line_source(options.input_path);
            bool is_stockholm = stockholm::sniff_stockholm(*source);
            std::cout << (is_stockholm ? "stockholm" : "unknown") << std::endl;
            return is_stockholm ? 0 : 1;
        }

        stockholm::log(stockholm::LogLevel::DEBUG,
                       "Reader options: type=" + stockholm::alphabet_to_string(options.reader.alphabet) +
                       " gs_policy=" + stockholm::gs_policy_to_string(options.reader.gs_policy) +
                       " require_signature=" + (options.reader.require_signature ? "true" : "false"));

        stockholm::StockholmReader reader(options.reader);
        stockholm::TabularMSA msa = reader.read_file(options.input_path);

        auto writer = stockholm::create_alignment_writer(options.output_path, options.format);
        writer->write_alignment(msa);
        writer->close();

        if (options.output_path != "-") {
            stockholm::log(stockholm::LogLevel::INFO, "Output written to: " + options.output_path);
        }
    } catch (const stockholm::StockholmFormatError& e) {
        stockholm::log(stockholm::LogLevel::ERROR,
                       stockholm::error_kind_to_string(e.kind()) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        stockholm::log(stockholm::LogLevel::ERROR, e.what());
        return 1;
    }

    return 0;
}
