/**
 * Tests for StockholmReader: the two-pass driver, assembly, factories,
 * configuration, and reading from files.
 */

#include <gtest/gtest.h>
#include "stockholm_reader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

using namespace stockholm;

static const std::string kRfamSample =
    "# STOCKHOLM 1.0\n"
    "#=GF RA   Deiman BA, Kortlever RM, Pleij CW;\n"
    "#=GF RL   J Mol Biol 1997;269:551-565.\n"
    "AF035635.1/619-641             UGAGUUCUCGAUCUCUAAAAUCG\n"
    "M24804.1/82-104                UGAGUUCUCUAUCUCUAAAAUCG\n"
    "J04243.1/2824-2846             UGAGUUCUCUAUCUCUAAAAUCG\n"
    "M24803.1/1-23                  UGAGUUCUCUAUCUCUAAAAUCG\n"
    "#=GC SS_cons                   .AAA....<<<<aaa....>>>>\n"
    "//\n";

static TabularMSA read_string(const std::string& text, const ReaderConfig& config = ReaderConfig()) {
    std::istringstream in(text);
    return read_stockholm(in, config);
}

static std::vector<char> chars(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

static std::string data_path(const std::string& name) {
    return std::string(TEST_DATA_DIR) + "/" + name;
}

// RAII temp file cleanup
class TempFile {
public:
    TempFile(const std::string& suffix = ".sto") {
        path_ = std::filesystem::temp_directory_path() /
                ("test_reader_" + std::to_string(counter_++) + suffix);
    }
    ~TempFile() {
        std::filesystem::remove(path_);
    }
    std::string path() const { return path_.string(); }
    void write(const std::string& content) const {
        std::ofstream out(path_);
        out << content;
    }
private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

// Helper: read and return the error kind, failing the test if none is thrown
static ErrorKind read_error_kind(const std::string& text, const ReaderConfig& config = ReaderConfig()) {
    try {
        read_string(text, config);
    } catch (const StockholmFormatError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected StockholmFormatError for input:\n" << text;
    return ErrorKind::EMPTY_ALIGNMENT;
}

// ============================================================================
// Complete alignments
// ============================================================================

TEST(StockholmReader, RfamSample) {
    TabularMSA msa = read_string(kRfamSample);

    ASSERT_EQ(msa.sequence_count(), 4u);
    EXPECT_EQ(msa.position_count(), 23u);

    std::vector<std::string> expected_index = {
        "AF035635.1/619-641", "M24804.1/82-104", "J04243.1/2824-2846", "M24803.1/1-23"
    };
    EXPECT_EQ(msa.index(), expected_index);
    EXPECT_EQ(msa[0].chars(), "UGAGUUCUCGAUCUCUAAAAUCG");
    EXPECT_EQ(msa[3].chars(), "UGAGUUCUCUAUCUCUAAAAUCG");

    ASSERT_EQ(msa.metadata().size(), 2u);
    EXPECT_EQ(msa.metadata().at("RA"), "  Deiman BA, Kortlever RM, Pleij CW;");
    EXPECT_EQ(msa.metadata().at("RL"), "  J Mol Biol 1997;269:551-565.");

    ASSERT_TRUE(msa.positional_metadata().has_value());
    ASSERT_EQ(msa.positional_metadata()->size(), 1u);
    const std::vector<char>& ss_cons = msa.positional_metadata()->at("SS_cons");
    EXPECT_EQ(ss_cons.size(), 23u);
    EXPECT_EQ(ss_cons, chars(".AAA....<<<<aaa....>>>>"));
}

TEST(StockholmReader, SequencesWithoutMarkupHaveAbsentMetadata) {
    TabularMSA msa = read_string(kRfamSample);
    for (const Sequence& seq : msa) {
        EXPECT_FALSE(seq.has_metadata());
        EXPECT_FALSE(seq.has_positional_metadata());
    }
}

TEST(StockholmReader, DefaultAlphabetIsProtein) {
    TabularMSA msa = read_string(kRfamSample);
    EXPECT_EQ(msa.alphabet(), Alphabet::PROTEIN);
}

TEST(StockholmReader, NoColumnMetadataIsAbsent) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\n"
        "seq1 ACDE\n"
        "seq2 ACDF\n"
        "//\n");
    EXPECT_FALSE(msa.positional_metadata().has_value());
    EXPECT_TRUE(msa.metadata().empty());
}

TEST(StockholmReader, PerSequenceMarkup) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\n"
        "#=GS seq1 AC P12345\n"
        "seq1 ACDE\n"
        "seq2 ACDF\n"
        "#=GR seq2 SS HHEE\n"
        "#=GR seq2 SA 9876\n"
        "//\n");

    const Sequence& seq1 = msa.at("seq1");
    ASSERT_TRUE(seq1.has_metadata());
    EXPECT_EQ(seq1.metadata()->at("AC"), "P12345");
    EXPECT_FALSE(seq1.has_positional_metadata());

    const Sequence& seq2 = msa.at("seq2");
    EXPECT_FALSE(seq2.has_metadata());
    ASSERT_TRUE(seq2.has_positional_metadata());
    EXPECT_EQ(seq2.positional_metadata()->at("SS"), chars("HHEE"));
    EXPECT_EQ(seq2.positional_metadata()->at("SA"), chars("9876"));
}

TEST(StockholmReader, GfConcatenation) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\n"
        "#=GF K a\n"
        "seq1 ACDE\n"
        "#=GF K b\n"
        "//\n");
    EXPECT_EQ(msa.metadata().at("K"), "a b");
}

TEST(StockholmReader, BlankLinesAndCommentsIgnored) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\n"
        "\n"
        "# a free-text comment\n"
        "   \n"
        "seq1 ACDE\n"
        "\n"
        "seq2 ACDF\n"
        "//\n"
        "\n");
    EXPECT_EQ(msa.sequence_count(), 2u);
}

TEST(StockholmReader, SignatureIsOptionalByDefault) {
    TabularMSA msa = read_string("seq1 ACDE\nseq2 ACDF\n");
    EXPECT_EQ(msa.sequence_count(), 2u);
}

TEST(StockholmReader, WindowsLineEndings) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\r\n"
        "#=GF ID test\r\n"
        "seq1 ACDE\r\n"
        "#=GC SS_cons HHEE\r\n"
        "//\r\n");
    EXPECT_EQ(msa[0].chars(), "ACDE");
    EXPECT_EQ(msa.metadata().at("ID"), "test");
    EXPECT_EQ(msa.positional_metadata()->at("SS_cons"), chars("HHEE"));
}

// ============================================================================
// Ordering
// ============================================================================

TEST(StockholmReader, OrderFollowsDataLinesNotMarkup) {
    TabularMSA msa = read_string(
        "# STOCKHOLM 1.0\n"
        "#=GS gamma AC G1\n"
        "#=GR beta SS HHEE\n"
        "gamma ACDE\n"
        "alpha ACDF\n"
        "beta  ACDG\n"
        "//\n");

    std::vector<std::string> expected = {"gamma", "alpha", "beta"};
    EXPECT_EQ(msa.index(), expected);
    EXPECT_EQ(msa[0].chars(), "ACDE");
    EXPECT_EQ(msa[2].chars(), "ACDG");
}

TEST(StockholmReader, MarkupBeforeDataMatchesMarkupAfterData) {
    TabularMSA before = read_string(
        "#=GS seq1 AC P1\n"
        "#=GR seq1 SS HHEE\n"
        "#=GC SS_cons HHEE\n"
        "seq1 ACDE\n");
    TabularMSA after = read_string(
        "seq1 ACDE\n"
        "#=GS seq1 AC P1\n"
        "#=GR seq1 SS HHEE\n"
        "#=GC SS_cons HHEE\n");
    EXPECT_EQ(before, after);
}

TEST(StockholmReader, RereadingSourceIsIdempotent) {
    std::istringstream in(kRfamSample);
    IstreamLineSource source(in);
    StockholmReader reader;

    TabularMSA first = reader.read(source);
    source.rewind();
    TabularMSA second = reader.read(source);

    EXPECT_EQ(first, second);
}

// ============================================================================
// Errors
// ============================================================================

TEST(StockholmReader, EmptyInput) {
    EXPECT_EQ(read_error_kind(""), ErrorKind::EMPTY_ALIGNMENT);
    EXPECT_EQ(read_error_kind("# STOCKHOLM 1.0\n//\n"), ErrorKind::EMPTY_ALIGNMENT);
    EXPECT_EQ(read_error_kind("# STOCKHOLM 1.0\n#=GF ID x\n//\n"), ErrorKind::EMPTY_ALIGNMENT);
}

TEST(StockholmReader, EmptyAlignmentMessage) {
    try {
        read_string("# STOCKHOLM 1.0\n//\n");
        FAIL() << "Expected StockholmFormatError";
    } catch (const StockholmFormatError& e) {
        EXPECT_EQ(std::string(e.what()), "No data present in file.");
    }
}

TEST(StockholmReader, DuplicateDataLabel) {
    EXPECT_EQ(read_error_kind("seq1 ACDE\nseq2 ACDF\nseq1 ACDG\n"),
              ErrorKind::DUPLICATE_SEQUENCE_LABEL);
}

TEST(StockholmReader, DuplicateColumnFeature) {
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GC SS_cons HHEE\n#=GC SS_cons HHHH\n"),
              ErrorKind::DUPLICATE_COLUMN_FEATURE);
}

TEST(StockholmReader, DuplicateSequenceColumnFeature) {
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GR seq1 SS HHEE\n#=GR seq1 SS HHHH\n"),
              ErrorKind::DUPLICATE_SEQUENCE_COLUMN_FEATURE);
}

TEST(StockholmReader, UndeclaredReferenceFails) {
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GS seq2 AC P1\n"),
              ErrorKind::UNDECLARED_SEQUENCE_REFERENCE);
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GR seq2 SS HHEE\n"),
              ErrorKind::UNDECLARED_SEQUENCE_REFERENCE);
}

TEST(StockholmReader, MalformedMarkup) {
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GC SS_cons\n"), ErrorKind::MALFORMED_MARKUP_LINE);
    EXPECT_EQ(read_error_kind("seq1 ACDE\n#=GF ID\n"), ErrorKind::MALFORMED_MARKUP_LINE);
}

TEST(StockholmReader, ErrorReportsLineNumber) {
    try {
        read_string("# STOCKHOLM 1.0\nseq1 ACDE\n\n#=GC SS_cons HHEE\n#=GC SS_cons HHHH\n//\n");
        FAIL() << "Expected StockholmFormatError";
    } catch (const StockholmFormatError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DUPLICATE_COLUMN_FEATURE);
        EXPECT_EQ(e.line_number(), 5u);
        EXPECT_EQ(e.line(), "#=GC SS_cons HHHH");
    }
}

TEST(StockholmReader, UnequalSequenceLengths) {
    EXPECT_THROW(read_string("seq1 ACDE\nseq2 ACD\n"), std::invalid_argument);
}

TEST(StockholmReader, ColumnMetadataLengthMismatch) {
    EXPECT_THROW(read_string("seq1 ACDE\n#=GC SS_cons HHE\n"), std::invalid_argument);
}

TEST(StockholmReader, SequenceColumnMetadataLengthMismatch) {
    EXPECT_THROW(read_string("seq1 ACDE\n#=GR seq1 SS HHEEE\n"), std::invalid_argument);
}

TEST(StockholmReader, InvalidCharacterForAlphabet) {
    ReaderConfig config;
    config.alphabet = Alphabet::DNA;
    EXPECT_THROW(read_string("seq1 ACGU\n", config), std::invalid_argument);

    config.alphabet = Alphabet::RNA;
    EXPECT_NO_THROW(read_string("seq1 ACGU\n", config));
}

// ============================================================================
// Configuration
// ============================================================================

static const std::string kRepeatedGs =
    "# STOCKHOLM 1.0\n"
    "seq1 ACDE\n"
    "#=GS seq1 AC P12345\n"
    "#=GS seq1 DE Hypothetical\n"
    "#=GS seq1 DE protein\n"
    "//\n";

TEST(StockholmReader, GsFirstLineOnlyByDefault) {
    TabularMSA msa = read_string(kRepeatedGs);
    const Metadata& metadata = *msa[0].metadata();
    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata.at("AC"), "P12345");
}

TEST(StockholmReader, GsConcatenate) {
    ReaderConfig config;
    config.gs_policy = GsPolicy::CONCATENATE;
    TabularMSA msa = read_string(kRepeatedGs, config);

    const Metadata& metadata = *msa[0].metadata();
    ASSERT_EQ(metadata.size(), 2u);
    EXPECT_EQ(metadata.at("DE"), "Hypothetical protein");
}

TEST(StockholmReader, GsRejectDuplicates) {
    ReaderConfig config;
    config.gs_policy = GsPolicy::REJECT_DUPLICATES;
    EXPECT_EQ(read_error_kind(kRepeatedGs, config), ErrorKind::DUPLICATE_SEQUENCE_FEATURE);
}

TEST(StockholmReader, RequireSignature) {
    ReaderConfig config;
    config.require_signature = true;

    EXPECT_EQ(read_string(kRfamSample, config).sequence_count(), 4u);
    EXPECT_EQ(read_error_kind("seq1 ACDE\n", config), ErrorKind::MISSING_SIGNATURE);
    EXPECT_EQ(read_error_kind("", config), ErrorKind::MISSING_SIGNATURE);
}

// ============================================================================
// Factories
// ============================================================================

TEST(StockholmReader, CustomSequenceFactory) {
    std::vector<std::string> seen;
    StockholmReader reader;
    reader.set_sequence_factory([&seen](const std::string& chars,
                                        std::optional<Metadata> metadata,
                                        std::optional<PositionalMetadata> positional) {
        seen.push_back(chars);
        return Sequence(chars, std::move(metadata), std::move(positional), Alphabet::GENERIC);
    });

    std::istringstream in("seq1 AC~E\nseq2 ACDF\n");
    TabularMSA msa = reader.read(in);

    std::vector<std::string> expected = {"AC~E", "ACDF"};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(msa.alphabet(), Alphabet::GENERIC);
}

TEST(StockholmReader, CustomAlignmentFactoryReceivesParts) {
    StockholmReader reader;
    size_t calls = 0;
    reader.set_alignment_factory([&calls](std::vector<Sequence> sequences,
                                          Metadata metadata,
                                          std::optional<PositionalMetadata> positional,
                                          std::vector<std::string> index) {
        ++calls;
        EXPECT_EQ(sequences.size(), 4u);
        EXPECT_EQ(index.size(), 4u);
        EXPECT_EQ(metadata.count("RA"), 1u);
        EXPECT_TRUE(positional.has_value());
        return TabularMSA(std::move(sequences), std::move(metadata),
                          std::move(positional), std::move(index));
    });

    std::istringstream in(kRfamSample);
    reader.read(in);
    EXPECT_EQ(calls, 1u);
}

TEST(StockholmReader, FactoryErrorsPropagate) {
    StockholmReader reader;
    reader.set_sequence_factory([](const std::string&,
                                   std::optional<Metadata>,
                                   std::optional<PositionalMetadata>) -> Sequence {
        throw std::invalid_argument("rejected");
    });

    std::istringstream in("seq1 ACDE\n");
    EXPECT_THROW(reader.read(in), std::invalid_argument);
}

TEST(StockholmReader, EmptyFactoryRejected) {
    StockholmReader reader;
    EXPECT_THROW(reader.set_sequence_factory(SequenceFactory()), std::invalid_argument);
    EXPECT_THROW(reader.set_alignment_factory(AlignmentFactory()), std::invalid_argument);
}

// ============================================================================
// Pass sequencing
// ============================================================================

TEST(ParseSession, PassesAdvanceState) {
    StockholmReader reader;
    std::istringstream in(kRfamSample);
    IstreamLineSource source(in);
    ParseSession session;

    reader.scan_data(session, source);
    EXPECT_EQ(session.state, ParseState::SCANNING_MARKUP);
    EXPECT_EQ(session.records.size(), 4u);
    EXPECT_EQ(session.data_lines, 4u);
    EXPECT_TRUE(session.metadata.empty());

    reader.scan_markup(session, source);
    EXPECT_EQ(session.state, ParseState::ASSEMBLING);
    EXPECT_EQ(session.markup_lines, 3u);
    EXPECT_EQ(session.metadata.size(), 2u);

    TabularMSA msa = reader.assemble(session);
    EXPECT_EQ(session.state, ParseState::DONE);
    EXPECT_EQ(msa.sequence_count(), 4u);
}

TEST(ParseSession, OnlyMarkupLinesCounted) {
    StockholmReader reader;
    std::istringstream in(
        "# STOCKHOLM 1.0\n"
        "# free comment\n"
        "\n"
        "seq1 ACDE\n"
        "#=GF ID demo\n"
        "#=GS seq1 AC P00001\n"
        "#=GR seq1 SS HHHH\n"
        "#=GC SS_cons HHHH\n"
        "seq2 ACDF\n"
        "//\n");
    IstreamLineSource source(in);
    ParseSession session;

    reader.scan_data(session, source);
    reader.scan_markup(session, source);
    EXPECT_EQ(session.data_lines, 2u);
    EXPECT_EQ(session.markup_lines, 4u);
}

TEST(ParseSession, OutOfOrderPassesRejected) {
    StockholmReader reader;
    std::istringstream in(kRfamSample);
    IstreamLineSource source(in);

    ParseSession fresh;
    EXPECT_THROW(reader.scan_markup(fresh, source), std::logic_error);
    EXPECT_THROW(reader.assemble(fresh), std::logic_error);

    reader.scan_data(fresh, source);
    EXPECT_THROW(reader.scan_data(fresh, source), std::logic_error);
}

TEST(ParseSession, StateNames) {
    EXPECT_EQ(parse_state_to_string(ParseState::SCANNING_DATA), "ScanningData");
    EXPECT_EQ(parse_state_to_string(ParseState::DONE), "Done");
}

// ============================================================================
// Files
// ============================================================================

TEST(ReadFile, RfamSampleFile) {
    TabularMSA msa = read_stockholm(data_path("rfam_sample.sto"));
    EXPECT_EQ(msa.sequence_count(), 4u);
    EXPECT_EQ(msa.position_count(), 23u);
    EXPECT_EQ(msa.positional_metadata()->at("SS_cons").size(), 23u);
}

TEST(ReadFile, PfamMarkupFile) {
    TabularMSA msa = read_stockholm(data_path("pfam_markup.sto"));

    std::vector<std::string> expected = {"O83071/192-246", "O31698/18-71", "O31699/88-139"};
    EXPECT_EQ(msa.index(), expected);
    EXPECT_EQ(msa.position_count(), 43u);
    EXPECT_EQ(msa.metadata().at("ID"), "   CBS");
    EXPECT_EQ(msa.metadata().at("AC"), "   PF00571");

    // Only the first #=GS line of O83071 is kept
    const Sequence& o83071 = msa.at("O83071/192-246");
    ASSERT_TRUE(o83071.has_metadata());
    EXPECT_EQ(o83071.metadata()->size(), 1u);
    EXPECT_EQ(o83071.metadata()->at("AC"), "O83071");
    EXPECT_EQ(o83071.positional_metadata()->at("SA").size(), 43u);

    EXPECT_EQ(msa.at("O31699/88-139").positional_metadata()->at("AS")[16], '*');
}

TEST(ReadFile, GzipFile) {
    TempFile gz(".sto.gz");
    gzFile out = gzopen(gz.path().c_str(), "wb");
    ASSERT_NE(out, nullptr);
    ASSERT_GT(gzwrite(out, kRfamSample.data(), static_cast<unsigned>(kRfamSample.size())), 0);
    gzclose(out);

    TabularMSA from_gz = read_stockholm(gz.path());
    EXPECT_EQ(from_gz, read_string(kRfamSample));
}

TEST(ReadFile, PlainTempFile) {
    TempFile file;
    file.write(kRfamSample);
    EXPECT_EQ(read_stockholm(file.path()), read_string(kRfamSample));
}

TEST(ReadFile, MissingFile) {
    EXPECT_THROW(read_stockholm(data_path("does_not_exist.sto")), std::runtime_error);
}
