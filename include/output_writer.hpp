/**
 * Output Writer - Alignment Reports
 *
 * Supports a human-readable summary (default), TSV and JSON reports of a
 * parsed alignment. Output goes to a file, stdout ("-" or empty path), or
 * a gzip file when the path ends in .gz.
 */

#ifndef STOCKHOLM_OUTPUT_WRITER_HPP
#define STOCKHOLM_OUTPUT_WRITER_HPP

#include "msa.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

namespace stockholm {

/**
 * Output format types
 */
enum class OutputFormat {
    SUMMARY,    // Alignment overview (default)
    TSV,        // One row per sequence
    JSON        // Full alignment as a JSON object
};

/**
 * Parse output format from string
 * @throws std::invalid_argument for unknown formats
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "summary" || lower == "text") return OutputFormat::SUMMARY;
    if (lower == "tsv") return OutputFormat::TSV;
    if (lower == "json") return OutputFormat::JSON;

    throw std::invalid_argument("Unknown output format: " + format);
}

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

/**
 * Join metadata as KEY=VALUE pairs separated by ';', or "-" if absent
 */
inline std::string format_metadata_field(const std::optional<Metadata>& metadata) {
    if (!metadata || metadata->empty()) return "-";
    std::string result;
    for (const auto& [key, value] : *metadata) {
        if (!result.empty()) result += ";";
        result += key + "=" + value;
    }
    return result;
}

/**
 * Join positional metadata keys separated by ',', or "-" if absent
 */
inline std::string format_positional_keys(const std::optional<PositionalMetadata>& positional) {
    if (!positional || positional->empty()) return "-";
    std::string result;
    for (const auto& entry : *positional) {
        if (!result.empty()) result += ",";
        result += entry.first;
    }
    return result;
}

/**
 * Abstract base class for alignment writers
 */
class AlignmentWriter {
public:
    explicit AlignmentWriter(const std::string& output_path)
        : output_path_(output_path), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            return;
        } else if (ends_with_gz(output_path_)) {
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~AlignmentWriter() {
        close();
    }

    // Prevent copying
    AlignmentWriter(const AlignmentWriter&) = delete;
    AlignmentWriter& operator=(const AlignmentWriter&) = delete;

    virtual void write_alignment(const TabularMSA& msa) = 0;

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

protected:
    void write_string(const std::string& s) {
        if (gz_file_) {
            if (!s.empty() &&
                gzwrite(gz_file_, s.data(), static_cast<unsigned>(s.size())) == 0) {
                throw std::runtime_error("Error writing compressed output: " + output_path_);
            }
        } else if (use_stdout_) {
            std::cout << s;
        } else {
            output_ << s;
        }
    }

    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
            }
        }
        return result;
    }

private:
    std::string output_path_;
    gzFile gz_file_;
    bool use_stdout_;
    std::ofstream output_;
};

/**
 * Summary writer: type, metadata, stats and the aligned rows
 *
 *   TabularMSA[RNA]
 *   -------------------------------------------------
 *   Metadata:
 *       'RA': '   Deiman BA, Kortlever RM, Pleij CW;'
 *   Positional metadata:
 *       'SS_cons': <dtype: object>
 *   Stats:
 *       sequence count: 4
 *       position count: 23
 *   -------------------------------------------------
 *   UGAGUUCUCGAUCUCUAAAAUCG
 *   ...
 */
class SummaryWriter : public AlignmentWriter {
public:
    static constexpr size_t MAX_ROWS = 10;
    static constexpr size_t MAX_WIDTH = 71;

    explicit SummaryWriter(const std::string& output_path)
        : AlignmentWriter(output_path) {}

    void write_alignment(const TabularMSA& msa) override {
        write_string(format_summary(msa));
    }

    static std::string format_summary(const TabularMSA& msa) {
        const std::string rule(49, '-');
        std::ostringstream oss;

        oss << "TabularMSA[" << alphabet_to_string(msa.alphabet()) << "]\n";
        oss << rule << "\n";

        if (!msa.metadata().empty()) {
            oss << "Metadata:\n";
            for (const auto& [key, value] : msa.metadata()) {
                oss << "    '" << key << "': '" << value << "'\n";
            }
        }

        if (msa.positional_metadata() && !msa.positional_metadata()->empty()) {
            oss << "Positional metadata:\n";
            for (const auto& entry : *msa.positional_metadata()) {
                oss << "    '" << entry.first << "': <dtype: object>\n";
            }
        }

        oss << "Stats:\n";
        oss << "    sequence count: " << msa.sequence_count() << "\n";
        oss << "    position count: " << msa.position_count() << "\n";
        oss << rule << "\n";

        size_t n = msa.sequence_count();
        for (size_t i = 0; i < n; ++i) {
            if (n > MAX_ROWS && i == MAX_ROWS / 2) {
                oss << "...\n";
                i = n - MAX_ROWS / 2 - 1;
                continue;
            }
            oss << truncate_row(msa[i].chars()) << "\n";
        }

        return oss.str();
    }

private:
    static std::string truncate_row(const std::string& row) {
        if (row.size() <= MAX_WIDTH) return row;
        size_t tail = (MAX_WIDTH - 3) / 2;
        size_t head = MAX_WIDTH - 3 - tail;
        return row.substr(0, head) + "..." + row.substr(row.size() - tail);
    }
};

/**
 * TSV writer: one row per sequence, then one row per column annotation
 */
class TSVWriter : public AlignmentWriter {
public:
    explicit TSVWriter(const std::string& output_path)
        : AlignmentWriter(output_path) {}

    void write_alignment(const TabularMSA& msa) override {
        std::ostringstream out;
        out << "#label\tsequence\tmetadata\tpositional_metadata\n";

        for (size_t i = 0; i < msa.sequence_count(); ++i) {
            const Sequence& seq = msa[i];
            out << msa.index()[i] << "\t"
                << seq.chars() << "\t"
                << format_metadata_field(seq.metadata()) << "\t"
                << format_positional_keys(seq.positional_metadata()) << "\n";
        }

        // Column annotations (#=GC)
        if (msa.positional_metadata()) {
            for (const auto& [key, values] : *msa.positional_metadata()) {
                out << "#=GC " << key << "\t"
                    << std::string(values.begin(), values.end()) << "\t-\t-\n";
            }
        }

        write_string(out.str());
    }
};

/**
 * JSON writer: the whole alignment as one object
 */
class JSONWriter : public AlignmentWriter {
public:
    explicit JSONWriter(const std::string& output_path)
        : AlignmentWriter(output_path) {}

    void write_alignment(const TabularMSA& msa) override {
        std::ostringstream json;
        json << "{\n";
        json << "  \"alphabet\": \"" << escape_json(alphabet_to_string(msa.alphabet())) << "\",\n";
        json << "  \"sequence_count\": " << msa.sequence_count() << ",\n";
        json << "  \"position_count\": " << msa.position_count() << ",\n";
        json << "  \"metadata\": " << metadata_object(msa.metadata(), "  ") << ",\n";
        json << "  \"positional_metadata\": "
             << positional_object(msa.positional_metadata(), "  ") << ",\n";
        json << "  \"sequences\": [";

        for (size_t i = 0; i < msa.sequence_count(); ++i) {
            const Sequence& seq = msa[i];
            if (i > 0) json << ",";
            json << "\n    {\n";
            json << "      \"label\": \"" << escape_json(msa.index()[i]) << "\",\n";
            json << "      \"sequence\": \"" << escape_json(seq.chars()) << "\",\n";
            json << "      \"metadata\": "
                 << (seq.metadata() ? metadata_object(*seq.metadata(), "      ") : "null") << ",\n";
            json << "      \"positional_metadata\": "
                 << positional_object(seq.positional_metadata(), "      ") << "\n";
            json << "    }";
        }

        if (msa.sequence_count() > 0) json << "\n  ";
        json << "]\n";
        json << "}\n";

        write_string(json.str());
    }

private:
    static std::string metadata_object(const Metadata& metadata, const std::string& indent) {
        if (metadata.empty()) return "{}";
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        for (const auto& [key, value] : metadata) {
            if (!first) oss << ",";
            oss << "\n" << indent << "  \"" << escape_json(key) << "\": \"" << escape_json(value) << "\"";
            first = false;
        }
        oss << "\n" << indent << "}";
        return oss.str();
    }

    static std::string positional_object(const std::optional<PositionalMetadata>& positional,
                                         const std::string& indent) {
        if (!positional) return "null";
        if (positional->empty()) return "{}";
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        for (const auto& [key, values] : *positional) {
            if (!first) oss << ",";
            oss << "\n" << indent << "  \"" << escape_json(key) << "\": \""
                << escape_json(std::string(values.begin(), values.end())) << "\"";
            first = false;
        }
        oss << "\n" << indent << "}";
        return oss.str();
    }
};

/**
 * Factory function to create appropriate writer
 */
inline std::unique_ptr<AlignmentWriter> create_alignment_writer(
    const std::string& output_path,
    OutputFormat format) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path);
    } else if (format == OutputFormat::TSV) {
        return std::make_unique<TSVWriter>(output_path);
    } else {
        return std::make_unique<SummaryWriter>(output_path);
    }
}

} // namespace stockholm

#endif // STOCKHOLM_OUTPUT_WRITER_HPP
