/**
 * Stockholm Alignment Reader - Implementation
 */

#include "stockholm_reader.hpp"
#include "logging.hpp"
#include <cctype>
#include <sstream>
#include <utility>

namespace stockholm {

namespace {

bool starts_with(const std::string& line, const char* prefix) {
    return line.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

std::string quote(const std::string& s) {
    return "'" + s + "'";
}

std::string to_lower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    size_t end = s.find_last_not_of(" \t");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

bool parse_bool_option(const std::string& key, const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw std::invalid_argument("Invalid boolean for option '" + key + "': " + value);
}

std::string format_error_message(const std::string& message, const std::string& line, size_t line_number) {
    std::string result = message;
    if (line_number > 0) {
        result += " (line " + std::to_string(line_number) + ")";
    }
    if (!line.empty()) {
        result += ": " + line;
    }
    return result;
}

SequenceRecord* find_referenced_record(
    SequenceRegistry& records,
    const std::string& label,
    const std::string& line,
    size_t line_number
) {
    SequenceRecord* record = records.find(label);
    if (!record) {
        throw StockholmFormatError(
            ErrorKind::UNDECLARED_SEQUENCE_REFERENCE,
            "Markup line references nonexistent data " + quote(label),
            line, line_number);
    }
    return record;
}

}  // namespace

// ============================================================================
// Line Classification
// ============================================================================

std::string line_kind_to_string(LineKind kind) {
    switch (kind) {
        case LineKind::DATA:       return "data";
        case LineKind::GF:         return "#=GF";
        case LineKind::GS:         return "#=GS";
        case LineKind::GR:         return "#=GR";
        case LineKind::GC:         return "#=GC";
        case LineKind::TERMINATOR: return "terminator";
        case LineKind::IGNORABLE:  return "ignorable";
    }
    return "unknown";
}

bool is_blank_line(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_data_line(const std::string& line) {
    return !(starts_with(line, "#") || starts_with(line, "//") || is_blank_line(line));
}

LineKind classify_line(const std::string& line) {
    if (is_blank_line(line)) return LineKind::IGNORABLE;
    if (starts_with(line, "//")) return LineKind::TERMINATOR;

    if (line[0] == '#') {
        if (starts_with(line, "#=GF")) return LineKind::GF;
        if (starts_with(line, "#=GS")) return LineKind::GS;
        if (starts_with(line, "#=GR")) return LineKind::GR;
        if (starts_with(line, "#=GC")) return LineKind::GC;
        return LineKind::IGNORABLE;
    }

    return LineKind::DATA;
}

// ============================================================================
// Format Sniffing
// ============================================================================

bool is_stockholm_signature(const std::string& first_line) {
    return first_line.size() >= STOCKHOLM_SIGNATURE.size() &&
           first_line.compare(0, STOCKHOLM_SIGNATURE.size(), STOCKHOLM_SIGNATURE) == 0;
}

bool sniff_stockholm(LineSource& source) {
    std::string line;
    if (!source.next_line(line)) return false;
    return is_stockholm_signature(line);
}

bool sniff_stockholm(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) return false;
    return is_stockholm_signature(line);
}

// ============================================================================
// Errors
// ============================================================================

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DUPLICATE_SEQUENCE_LABEL:          return "DuplicateSequenceLabel";
        case ErrorKind::UNDECLARED_SEQUENCE_REFERENCE:     return "UndeclaredSequenceReference";
        case ErrorKind::DUPLICATE_COLUMN_FEATURE:          return "DuplicateColumnFeature";
        case ErrorKind::DUPLICATE_SEQUENCE_COLUMN_FEATURE: return "DuplicateSequenceColumnFeature";
        case ErrorKind::DUPLICATE_SEQUENCE_FEATURE:        return "DuplicateSequenceFeature";
        case ErrorKind::MALFORMED_MARKUP_LINE:             return "MalformedMarkupLine";
        case ErrorKind::MALFORMED_DATA_LINE:               return "MalformedDataLine";
        case ErrorKind::MISSING_SIGNATURE:                 return "MissingSignature";
        case ErrorKind::EMPTY_ALIGNMENT:                   return "EmptyAlignment";
    }
    return "Unknown";
}

StockholmFormatError::StockholmFormatError(
    ErrorKind kind,
    const std::string& message,
    const std::string& line,
    size_t line_number
) : std::runtime_error(format_error_message(message, line, line_number)),
    kind_(kind), line_(line), line_number_(line_number) {}

// ============================================================================
// Configuration
// ============================================================================

GsPolicy parse_gs_policy(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "first" || lower == "first_line_only") return GsPolicy::FIRST_LINE_ONLY;
    if (lower == "concatenate") return GsPolicy::CONCATENATE;
    if (lower == "reject" || lower == "reject_duplicates") return GsPolicy::REJECT_DUPLICATES;
    throw std::invalid_argument("Unknown GS policy: " + name);
}

std::string gs_policy_to_string(GsPolicy policy) {
    switch (policy) {
        case GsPolicy::FIRST_LINE_ONLY:   return "first";
        case GsPolicy::CONCATENATE:       return "concatenate";
        case GsPolicy::REJECT_DUPLICATES: return "reject";
    }
    return "first";
}

void parse_reader_options(const std::string& options, ReaderConfig& config) {
    // Format: key1=value1;key2=value2
    std::istringstream iss(options);
    std::string pair;
    while (std::getline(iss, pair, ';')) {
        pair = trim(pair);
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Reader option must be key=value: " + pair);
        }
        std::string key = trim(pair.substr(0, eq));
        std::string value = trim(pair.substr(eq + 1));

        if (key == "gs_policy") {
            config.gs_policy = parse_gs_policy(value);
        } else if (key == "alphabet") {
            config.alphabet = parse_alphabet(value);
        } else if (key == "require_signature") {
            config.require_signature = parse_bool_option(key, value);
        } else {
            throw std::invalid_argument("Unknown reader option: " + key);
        }
    }
}

std::string parse_state_to_string(ParseState state) {
    switch (state) {
        case ParseState::SCANNING_DATA:   return "ScanningData";
        case ParseState::SCANNING_MARKUP: return "ScanningMarkup";
        case ParseState::ASSEMBLING:      return "Assembling";
        case ParseState::DONE:            return "Done";
    }
    return "Unknown";
}

// ============================================================================
// Line Parsers
// ============================================================================

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::vector<std::string> split_on_space(const std::string& line, size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        size_t pos = line.find(' ', start);
        if (pos == std::string::npos) break;
        fields.emplace_back(line, start, pos - start);
        start = pos + 1;
    }
    fields.emplace_back(line, start);
    return fields;
}

void parse_gf_line(const std::string& line, Metadata& metadata, size_t line_number) {
    auto fields = split_on_space(line, 3);
    if (fields.size() < 3) {
        throw StockholmFormatError(
            ErrorKind::MALFORMED_MARKUP_LINE,
            "Malformed #=GF line: expected a feature and data",
            line, line_number);
    }

    const std::string& feature = fields[1];
    const std::string& data = fields[2];

    auto it = metadata.find(feature);
    if (it != metadata.end()) {
        it->second += " " + data;
    } else {
        metadata.emplace(feature, data);
    }
}

void parse_gs_line(
    const std::string& line,
    SequenceRegistry& records,
    GsPolicy policy,
    size_t line_number
) {
    auto fields = split_on_space(line, 4);
    if (fields.size() < 4) {
        throw StockholmFormatError(
            ErrorKind::MALFORMED_MARKUP_LINE,
            "Malformed #=GS line: expected a sequence name, a feature and data",
            line, line_number);
    }

    const std::string& label = fields[1];
    const std::string& feature = fields[2];
    const std::string& data = fields[3];

    SequenceRecord* record = find_referenced_record(records, label, line, line_number);

    if (policy == GsPolicy::FIRST_LINE_ONLY) {
        if (record->metadata) {
            log(LogLevel::DEBUG, "Ignoring #=GS " + feature + " for " + quote(label) +
                                 ": sequence metadata already set");
            return;
        }
        record->metadata = Metadata{{feature, data}};
        return;
    }

    if (!record->metadata) {
        record->metadata.emplace();
    }
    Metadata& seq_metadata = *record->metadata;

    auto it = seq_metadata.find(feature);
    if (it == seq_metadata.end()) {
        seq_metadata.emplace(feature, data);
    } else if (policy == GsPolicy::CONCATENATE) {
        it->second += " " + data;
    } else {
        throw StockholmFormatError(
            ErrorKind::DUPLICATE_SEQUENCE_FEATURE,
            "Found duplicate GS label " + quote(feature) +
                " associated with data label " + quote(label),
            line, line_number);
    }
}

void parse_gr_line(const std::string& line, SequenceRegistry& records, size_t line_number) {
    auto fields = split_whitespace(line);
    if (fields.size() < 4) {
        throw StockholmFormatError(
            ErrorKind::MALFORMED_MARKUP_LINE,
            "Malformed #=GR line: expected a sequence name, a feature and column data",
            line, line_number);
    }

    const std::string& label = fields[1];
    const std::string& feature = fields[2];
    const std::string& data = fields[3];

    SequenceRecord* record = find_referenced_record(records, label, line, line_number);

    if (record->position_metadata && record->position_metadata->count(feature) > 0) {
        throw StockholmFormatError(
            ErrorKind::DUPLICATE_SEQUENCE_COLUMN_FEATURE,
            "Found duplicate GR label " + quote(feature) +
                " associated with data label " + quote(label),
            line, line_number);
    }

    if (!record->position_metadata) {
        record->position_metadata.emplace();
    }
    record->position_metadata->emplace(feature, std::vector<char>(data.begin(), data.end()));
}

void parse_gc_line(const std::string& line, PositionalMetadata& column_metadata, size_t line_number) {
    auto fields = split_whitespace(line);
    if (fields.size() < 3) {
        throw StockholmFormatError(
            ErrorKind::MALFORMED_MARKUP_LINE,
            "Malformed #=GC line: expected a feature and column data",
            line, line_number);
    }

    const std::string& feature = fields[1];
    const std::string& data = fields[2];

    if (column_metadata.count(feature) > 0) {
        throw StockholmFormatError(
            ErrorKind::DUPLICATE_COLUMN_FEATURE,
            "Found duplicate GC label " + quote(feature),
            line, line_number);
    }

    column_metadata.emplace(feature, std::vector<char>(data.begin(), data.end()));
}

void parse_data_line(const std::string& line, SequenceRegistry& records, size_t line_number) {
    auto fields = split_whitespace(line);
    if (fields.size() < 2) {
        throw StockholmFormatError(
            ErrorKind::MALFORMED_DATA_LINE,
            "Data line has no sequence characters",
            line, line_number);
    }

    const std::string& label = fields[0];

    SequenceRecord record;
    record.label = label;
    record.sequence = fields[1];

    if (!records.insert(label, std::move(record))) {
        throw StockholmFormatError(
            ErrorKind::DUPLICATE_SEQUENCE_LABEL,
            "Found multiple data lines under same name: " + quote(label),
            line, line_number);
    }
}

// ============================================================================
// Reader
// ============================================================================

StockholmReader::StockholmReader(const ReaderConfig& config)
    : config_(config),
      sequence_factory_(make_sequence_factory(config.alphabet)),
      alignment_factory_(default_alignment_factory()) {}

void StockholmReader::set_sequence_factory(SequenceFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Sequence factory must not be empty");
    }
    sequence_factory_ = std::move(factory);
}

void StockholmReader::set_alignment_factory(AlignmentFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Alignment factory must not be empty");
    }
    alignment_factory_ = std::move(factory);
}

void StockholmReader::check_signature(LineSource& source) const {
    std::string first_line;
    bool has_line = source.next_line(first_line);
    source.rewind();

    if (!has_line || !is_stockholm_signature(first_line)) {
        throw StockholmFormatError(
            ErrorKind::MISSING_SIGNATURE,
            "Input does not start with " + quote(STOCKHOLM_SIGNATURE),
            first_line, has_line ? 1 : 0);
    }
}

TabularMSA StockholmReader::read(LineSource& source) const {
    if (config_.require_signature) {
        check_signature(source);
    }

    ParseSession session;
    scan_data(session, source);
    scan_markup(session, source);
    return assemble(session);
}

TabularMSA StockholmReader::read(std::istream& in) const {
    IstreamLineSource source(in);
    return read(source);
}

TabularMSA StockholmReader::read_file(const std::string& path) const {
    log(LogLevel::INFO, "Reading Stockholm alignment: " + path);

    auto source = open_line_source(path);
    TabularMSA msa = read(*source);

    log(LogLevel::INFO, "Loaded " + std::to_string(msa.sequence_count()) + " sequences (" +
                        std::to_string(msa.position_count()) + " positions) from " + path);
    return msa;
}

void StockholmReader::scan_data(ParseSession& session, LineSource& source) const {
    if (session.state != ParseState::SCANNING_DATA) {
        throw std::logic_error("Data pass requested in state " + parse_state_to_string(session.state));
    }

    std::string line;
    size_t line_number = 0;
    while (source.next_line(line)) {
        ++line_number;
        if (classify_line(line) != LineKind::DATA) continue;

        parse_data_line(line, session.records, line_number);
        session.data_lines++;
    }

    log(LogLevel::DEBUG, "Data pass over " + source.name() + ": " +
                         std::to_string(session.records.size()) + " sequence records in " +
                         std::to_string(line_number) + " lines");

    source.rewind();
    session.state = ParseState::SCANNING_MARKUP;
}

void StockholmReader::scan_markup(ParseSession& session, LineSource& source) const {
    if (session.state != ParseState::SCANNING_MARKUP) {
        throw std::logic_error("Markup pass requested in state " + parse_state_to_string(session.state));
    }

    std::string line;
    size_t line_number = 0;
    while (source.next_line(line)) {
        ++line_number;

        switch (classify_line(line)) {
            case LineKind::GF:
                parse_gf_line(line, session.metadata, line_number);
                break;
            case LineKind::GS:
                parse_gs_line(line, session.records, config_.gs_policy, line_number);
                break;
            case LineKind::GR:
                parse_gr_line(line, session.records, line_number);
                break;
            case LineKind::GC:
                parse_gc_line(line, session.column_metadata, line_number);
                break;
            case LineKind::DATA:
            case LineKind::TERMINATOR:
            case LineKind::IGNORABLE:
                continue;
        }
        session.markup_lines++;
    }

    log(LogLevel::DEBUG, "Markup pass over " + source.name() + ": applied " +
                         std::to_string(session.markup_lines) + " markup lines");

    session.state = ParseState::ASSEMBLING;
}

TabularMSA StockholmReader::assemble(ParseSession& session) const {
    if (session.state != ParseState::ASSEMBLING) {
        throw std::logic_error("Assembly requested in state " + parse_state_to_string(session.state));
    }

    if (session.records.empty()) {
        throw StockholmFormatError(ErrorKind::EMPTY_ALIGNMENT, "No data present in file.");
    }

    std::vector<Sequence> sequences;
    sequences.reserve(session.records.size());
    for (const auto& entry : session.records) {
        const SequenceRecord& record = entry.second;
        sequences.push_back(sequence_factory_(record.sequence, record.metadata, record.position_metadata));
    }

    std::optional<PositionalMetadata> column_metadata;
    if (!session.column_metadata.empty()) {
        column_metadata = session.column_metadata;
    }

    TabularMSA msa = alignment_factory_(
        std::move(sequences),
        session.metadata,
        std::move(column_metadata),
        session.records.keys());

    session.state = ParseState::DONE;
    return msa;
}

TabularMSA read_stockholm(const std::string& path, const ReaderConfig& config) {
    return StockholmReader(config).read_file(path);
}

TabularMSA read_stockholm(std::istream& in, const ReaderConfig& config) {
    return StockholmReader(config).read(in);
}

} // namespace stockholm
