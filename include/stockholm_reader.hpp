/**
 * Stockholm Alignment Reader
 *
 * Reads Stockholm 1.0 multiple sequence alignments into a TabularMSA:
 * - Line classification and format sniffing
 * - Per-line parsers for data lines and #=GF, #=GS, #=GR, #=GC markup
 * - Two-pass driver: data lines first (fixes sequence order), then markup
 * - Assembly of sequences and alignment through replaceable factories
 *
 * Example input:
 *
 *   # STOCKHOLM 1.0
 *   #=GF RA    Deiman BA, Kortlever RM, Pleij CW;
 *   AF035635.1/619-641             UGAGUUCUCGAUCUCUAAAAUCG
 *   M24804.1/82-104                UGAGUUCUCUAUCUCUAAAAUCG
 *   #=GC SS_cons                   .AAA....<<<<aaa....>>>>
 *   //
 */

#ifndef STOCKHOLM_READER_HPP
#define STOCKHOLM_READER_HPP

#include "line_source.hpp"
#include "msa.hpp"
#include "ordered_map.hpp"
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stockholm {

/**
 * Format header expected on the first line of a Stockholm file
 */
inline const std::string STOCKHOLM_SIGNATURE = "# STOCKHOLM 1.0";

// ============================================================================
// Line Classification
// ============================================================================

enum class LineKind {
    DATA,           // label followed by aligned characters
    GF,             // #=GF alignment-level feature
    GS,             // #=GS per-sequence feature
    GR,             // #=GR per-sequence per-column feature
    GC,             // #=GC per-column feature
    TERMINATOR,     // "//"
    IGNORABLE       // blank lines, header, other '#' comments
};

std::string line_kind_to_string(LineKind kind);

/**
 * Check if a line is empty or contains only whitespace
 */
bool is_blank_line(const std::string& line);

/**
 * Check if a line carries sequence data: not blank, not starting with
 * '#' and not starting with "//"
 */
bool is_data_line(const std::string& line);

/**
 * Classify a line (without its line terminator)
 */
LineKind classify_line(const std::string& line);

// ============================================================================
// Format Sniffing
// ============================================================================

/**
 * Check if the first 15 characters of a line are "# STOCKHOLM 1.0"
 */
bool is_stockholm_signature(const std::string& first_line);

/**
 * Read the first line and check for the Stockholm signature
 * Does not rewind; the caller restores the position before parsing.
 * @return false for an empty source
 */
bool sniff_stockholm(LineSource& source);
bool sniff_stockholm(std::istream& in);

// ============================================================================
// Errors
// ============================================================================

enum class ErrorKind {
    DUPLICATE_SEQUENCE_LABEL,           // same label on two data lines
    UNDECLARED_SEQUENCE_REFERENCE,      // #=GS/#=GR names a label with no data line
    DUPLICATE_COLUMN_FEATURE,           // #=GC feature repeated
    DUPLICATE_SEQUENCE_COLUMN_FEATURE,  // #=GR feature repeated for one label
    DUPLICATE_SEQUENCE_FEATURE,         // #=GS feature repeated (GsPolicy::REJECT_DUPLICATES)
    MALFORMED_MARKUP_LINE,              // too few fields for the markup kind
    MALFORMED_DATA_LINE,                // label without sequence characters
    MISSING_SIGNATURE,                  // header required but absent
    EMPTY_ALIGNMENT                     // no data lines at all
};

std::string error_kind_to_string(ErrorKind kind);

/**
 * Fatal Stockholm parse error
 * what() names the violated rule, the line number and the line content.
 */
class StockholmFormatError : public std::runtime_error {
public:
    StockholmFormatError(
        ErrorKind kind,
        const std::string& message,
        const std::string& line = "",
        size_t line_number = 0
    );

    ErrorKind kind() const { return kind_; }
    const std::string& line() const { return line_; }
    size_t line_number() const { return line_number_; }

private:
    ErrorKind kind_;
    std::string line_;
    size_t line_number_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * Handling of repeated #=GS lines for one sequence
 */
enum class GsPolicy {
    FIRST_LINE_ONLY,    // keep only the first #=GS line of each sequence
    CONCATENATE,        // keep all; repeated features join with a space
    REJECT_DUPLICATES   // keep all; a repeated feature is an error
};

GsPolicy parse_gs_policy(const std::string& name);
std::string gs_policy_to_string(GsPolicy policy);

struct ReaderConfig {
    GsPolicy gs_policy = GsPolicy::FIRST_LINE_ONLY;
    Alphabet alphabet = Alphabet::PROTEIN;
    bool require_signature = false;
};

/**
 * Apply options given as "key1=value1;key2=value2"
 * Keys: gs_policy, alphabet, require_signature
 * @throws std::invalid_argument for unknown keys or values
 */
void parse_reader_options(const std::string& options, ReaderConfig& config);

// ============================================================================
// Parse Session
// ============================================================================

/**
 * One sequence collected from a data line, plus its markup
 * metadata/position_metadata stay nullopt until a markup line sets them.
 */
struct SequenceRecord {
    std::string label;
    std::string sequence;
    std::optional<Metadata> metadata;
    std::optional<PositionalMetadata> position_metadata;
};

/**
 * Label -> record, in order of first appearance among data lines
 */
using SequenceRegistry = OrderedMap<std::string, SequenceRecord>;

enum class ParseState {
    SCANNING_DATA,
    SCANNING_MARKUP,
    ASSEMBLING,
    DONE
};

std::string parse_state_to_string(ParseState state);

/**
 * Intermediate state of one read
 */
struct ParseSession {
    ParseState state = ParseState::SCANNING_DATA;
    SequenceRegistry records;
    Metadata metadata;
    PositionalMetadata column_metadata;

    size_t data_lines = 0;
    size_t markup_lines = 0;
};

// ============================================================================
// Line Parsers
// ============================================================================

/**
 * Split on runs of whitespace, dropping empty fields
 */
std::vector<std::string> split_whitespace(const std::string& line);

/**
 * Split on single spaces into at most max_fields fields; the last field
 * holds the unsplit remainder
 */
std::vector<std::string> split_on_space(const std::string& line, size_t max_fields);

/**
 * #=GF <feature> <text>
 * Repeated features are joined with a single space.
 */
void parse_gf_line(const std::string& line, Metadata& metadata, size_t line_number = 0);

/**
 * #=GS <label> <feature> <text>
 */
void parse_gs_line(
    const std::string& line,
    SequenceRegistry& records,
    GsPolicy policy = GsPolicy::FIRST_LINE_ONLY,
    size_t line_number = 0
);

/**
 * #=GR <label> <feature> <column characters>
 */
void parse_gr_line(const std::string& line, SequenceRegistry& records, size_t line_number = 0);

/**
 * #=GC <feature> <column characters>
 */
void parse_gc_line(const std::string& line, PositionalMetadata& column_metadata, size_t line_number = 0);

/**
 * <label> <characters> [ignored fields...]
 */
void parse_data_line(const std::string& line, SequenceRegistry& records, size_t line_number = 0);

// ============================================================================
// Reader
// ============================================================================

class StockholmReader {
public:
    explicit StockholmReader(const ReaderConfig& config = ReaderConfig());

    /**
     * Replace the sequence constructor (default validates config alphabet)
     * @throws std::invalid_argument for an empty function
     */
    void set_sequence_factory(SequenceFactory factory);

    /**
     * Replace the alignment constructor (default builds a TabularMSA)
     * @throws std::invalid_argument for an empty function
     */
    void set_alignment_factory(AlignmentFactory factory);

    const ReaderConfig& config() const { return config_; }

    /**
     * Read one alignment; the source is rewound between the two passes
     * @throws StockholmFormatError on structural errors
     * @throws std::invalid_argument from the sequence/alignment factories
     * @throws std::runtime_error on I/O errors
     */
    TabularMSA read(LineSource& source) const;
    TabularMSA read(std::istream& in) const;

    /**
     * Read from a file path (plain, .gz, .bgz, or "-" for stdin)
     */
    TabularMSA read_file(const std::string& path) const;

    /**
     * Pass 1: collect data lines, then rewind the source
     */
    void scan_data(ParseSession& session, LineSource& source) const;

    /**
     * Pass 2: apply markup lines to the collected records
     */
    void scan_markup(ParseSession& session, LineSource& source) const;

    /**
     * Build sequences and alignment from a fully scanned session
     */
    TabularMSA assemble(ParseSession& session) const;

private:
    ReaderConfig config_;
    SequenceFactory sequence_factory_;
    AlignmentFactory alignment_factory_;

    void check_signature(LineSource& source) const;
};

/**
 * Convenience wrappers around StockholmReader
 */
TabularMSA read_stockholm(const std::string& path, const ReaderConfig& config = ReaderConfig());
TabularMSA read_stockholm(std::istream& in, const ReaderConfig& config = ReaderConfig());

} // namespace stockholm

#endif // STOCKHOLM_READER_HPP
