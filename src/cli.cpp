/**
 * Command-line options - Implementation
 */

#include "cli.hpp"
#include <iostream>
#include <stdexcept>

namespace stockholm {

void print_usage(const char* program_name) {
    std::cout << "stockholm_info - Stockholm Alignment Reader\n"
              << "============================================\n\n"
              << "Usage: " << program_name << " [OPTIONS] -i FILE\n\n"
              << "Input:\n"
              << "  -i, --input FILE        Stockholm file (plain, .gz, .bgz, or - for stdin)\n"
              << "  --sniff                 Only check the format header; prints 'stockholm'\n"
              << "                          or 'unknown' and exits 0 or 1\n\n"
              << "Parsing:\n"
              << "  -t, --type TYPE         Sequence type: generic, dna, rna, protein\n"
              << "                          (default: protein)\n"
              << "  --gs-policy POLICY      Repeated #=GS lines per sequence:\n"
              << "                            first        keep only the first line (default)\n"
              << "                            concatenate  join repeated features with a space\n"
              << "                            reject       fail on a repeated feature\n"
              << "  --require-signature     Fail unless the first line is '# STOCKHOLM 1.0'\n"
              << "  --options STR           Reader options as key1=value1;key2=value2\n"
              << "                          Keys: gs_policy, alphabet, require_signature\n\n"
              << "Output:\n"
              << "  -o, --output FILE       Output path (default: stdout; .gz compresses)\n"
              << "  -f, --format FORMAT     summary (default), tsv, json\n\n"
              << "Other Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n"
              << "  --quiet                 Only log warnings and errors\n\n"
              << "Examples:\n"
              << "  " << program_name << " -i PF00001.sto -t protein\n"
              << "  " << program_name << " -i rfam.sto.gz -t rna -f json -o rfam.json\n"
              << "  " << program_name << " -i msa.sto --gs-policy concatenate -f tsv\n"
              << std::endl;
}

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions options;

    auto require_value = [&args](size_t& i, const std::string& flag) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Option " + flag + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (arg == "-i" || arg == "--input") {
            options.input_path = require_value(i, arg);
        } else if (arg == "-o" || arg == "--output") {
            options.output_path = require_value(i, arg);
        } else if (arg == "-f" || arg == "--format") {
            options.format = parse_output_format(require_value(i, arg));
        } else if (arg == "-t" || arg == "--type") {
            options.reader.alphabet = parse_alphabet(require_value(i, arg));
        } else if (arg == "--gs-policy") {
            options.reader.gs_policy = parse_gs_policy(require_value(i, arg));
        } else if (arg == "--options") {
            parse_reader_options(require_value(i, arg), options.reader);
        } else if (arg == "--require-signature") {
            options.reader.require_signature = true;
        } else if (arg == "--sniff") {
            options.sniff_only = true;
        } else if (arg == "--debug") {
            options.log_level = LogLevel::DEBUG;
        } else if (arg == "--quiet") {
            options.log_level = LogLevel::WARNING;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (options.input_path.empty()) {
        throw std::invalid_argument("Input file (-i) is required");
    }

    return options;
}

CliOptions parse_cli_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_cli_args(args);
}

} // namespace stockholm
