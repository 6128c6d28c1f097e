/**
 * Sequences and Multiple Sequence Alignments
 *
 * Value types produced by the Stockholm reader:
 * - Sequence: aligned characters with optional per-sequence and
 *   per-position metadata
 * - TabularMSA: ordered, labelled, equal-length sequences with
 *   alignment-level and per-column metadata
 *
 * Both are built through replaceable factory functions so callers can
 * substitute their own validation.
 */

#ifndef STOCKHOLM_MSA_HPP
#define STOCKHOLM_MSA_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockholm {

/**
 * Feature key -> free-text value
 */
using Metadata = std::map<std::string, std::string>;

/**
 * Feature key -> one character per aligned position
 */
using PositionalMetadata = std::map<std::string, std::vector<char>>;

// ============================================================================
// Alphabets
// ============================================================================

enum class Alphabet {
    GENERIC,    // Any non-whitespace character
    DNA,        // ACGT + IUPAC degenerate codes
    RNA,        // ACGU + IUPAC degenerate codes
    PROTEIN     // 20 standard + O/U, degenerate B/Z/J/X, stop '*'
};

/**
 * Parse alphabet name (generic, dna, rna, protein; case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
Alphabet parse_alphabet(const std::string& name);

std::string alphabet_to_string(Alphabet alphabet);

/**
 * Check every character against the alphabet
 * Gap characters '-' and '.' are always accepted.
 * @throws std::invalid_argument naming the first invalid character
 */
void validate_alphabet(const std::string& chars, Alphabet alphabet);

// ============================================================================
// Sequence
// ============================================================================

class Sequence {
public:
    /**
     * @param chars Aligned characters
     * @param metadata Per-sequence metadata, or nullopt if absent
     * @param positional_metadata Per-position metadata, or nullopt if absent;
     *        every value must have one character per position
     * @param alphabet Alphabet the characters were validated against
     * @throws std::invalid_argument on positional metadata length mismatch
     */
    explicit Sequence(
        std::string chars,
        std::optional<Metadata> metadata = std::nullopt,
        std::optional<PositionalMetadata> positional_metadata = std::nullopt,
        Alphabet alphabet = Alphabet::GENERIC
    );

    const std::string& chars() const { return chars_; }
    size_t size() const { return chars_.size(); }
    char operator[](size_t i) const { return chars_[i]; }

    const std::optional<Metadata>& metadata() const { return metadata_; }
    const std::optional<PositionalMetadata>& positional_metadata() const {
        return positional_metadata_;
    }
    bool has_metadata() const { return metadata_.has_value(); }
    bool has_positional_metadata() const { return positional_metadata_.has_value(); }

    Alphabet alphabet() const { return alphabet_; }

    bool operator==(const Sequence& other) const;
    bool operator!=(const Sequence& other) const { return !(*this == other); }

private:
    std::string chars_;
    std::optional<Metadata> metadata_;
    std::optional<PositionalMetadata> positional_metadata_;
    Alphabet alphabet_;
};

/**
 * Builds a Sequence from raw characters and optional metadata
 * Throws on invalid content.
 */
using SequenceFactory = std::function<Sequence(
    const std::string& chars,
    std::optional<Metadata> metadata,
    std::optional<PositionalMetadata> positional_metadata
)>;

/**
 * Factory that validates characters against the alphabet before construction
 */
SequenceFactory make_sequence_factory(Alphabet alphabet);

// ============================================================================
// TabularMSA
// ============================================================================

class TabularMSA {
public:
    using container_type = std::vector<Sequence>;
    using const_iterator = container_type::const_iterator;

    /**
     * @param sequences Aligned sequences, all of equal length
     * @param metadata Alignment-level metadata (may be empty)
     * @param positional_metadata Per-column metadata or nullopt; every value
     *        must have one character per column
     * @param index Sequence labels, one per sequence, unique
     * @throws std::invalid_argument on any shape mismatch
     */
    TabularMSA(
        std::vector<Sequence> sequences,
        Metadata metadata,
        std::optional<PositionalMetadata> positional_metadata,
        std::vector<std::string> index
    );

    size_t sequence_count() const { return sequences_.size(); }
    size_t position_count() const { return position_count_; }
    bool empty() const { return sequences_.empty(); }

    const Sequence& operator[](size_t i) const { return sequences_[i]; }

    /**
     * Get sequence by label
     * @throws std::out_of_range if no sequence has this label
     */
    const Sequence& at(const std::string& label) const;

    /**
     * Characters of one column, top to bottom
     * @throws std::out_of_range if position >= position_count()
     */
    std::string column(size_t position) const;

    const std::vector<Sequence>& sequences() const { return sequences_; }
    const std::vector<std::string>& index() const { return index_; }
    const Metadata& metadata() const { return metadata_; }
    const std::optional<PositionalMetadata>& positional_metadata() const {
        return positional_metadata_;
    }

    /**
     * Alphabet of the first sequence, GENERIC when empty
     */
    Alphabet alphabet() const;

    const_iterator begin() const { return sequences_.cbegin(); }
    const_iterator end() const { return sequences_.cend(); }

    bool operator==(const TabularMSA& other) const;
    bool operator!=(const TabularMSA& other) const { return !(*this == other); }

private:
    std::vector<Sequence> sequences_;
    Metadata metadata_;
    std::optional<PositionalMetadata> positional_metadata_;
    std::vector<std::string> index_;
    std::map<std::string, size_t> label_to_row_;
    size_t position_count_ = 0;
};

/**
 * Builds the alignment from the assembled parts
 * Throws on shape mismatches.
 */
using AlignmentFactory = std::function<TabularMSA(
    std::vector<Sequence> sequences,
    Metadata metadata,
    std::optional<PositionalMetadata> positional_metadata,
    std::vector<std::string> index
)>;

AlignmentFactory default_alignment_factory();

} // namespace stockholm

#endif // STOCKHOLM_MSA_HPP
