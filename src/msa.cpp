/**
 * Sequences and Multiple Sequence Alignments - Implementation
 */

#include "msa.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

namespace stockholm {

// ============================================================================
// Alphabets
// ============================================================================

namespace {

const std::string kGapChars = "-.";
const std::string kDnaChars = "ACGTRYSWKMBDHVN";
const std::string kRnaChars = "ACGURYSWKMBDHVN";
const std::string kProteinChars = "ACDEFGHIKLMNOPQRSTUVWYBZJX*";

bool is_allowed(char c, Alphabet alphabet) {
    if (kGapChars.find(c) != std::string::npos) return true;

    switch (alphabet) {
        case Alphabet::DNA:     return kDnaChars.find(c) != std::string::npos;
        case Alphabet::RNA:     return kRnaChars.find(c) != std::string::npos;
        case Alphabet::PROTEIN: return kProteinChars.find(c) != std::string::npos;
        case Alphabet::GENERIC:
        default:
            return std::isgraph(static_cast<unsigned char>(c)) != 0;
    }
}

}  // namespace

Alphabet parse_alphabet(const std::string& name) {
    std::string lower = name;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "generic") return Alphabet::GENERIC;
    if (lower == "dna") return Alphabet::DNA;
    if (lower == "rna") return Alphabet::RNA;
    if (lower == "protein") return Alphabet::PROTEIN;

    throw std::invalid_argument("Unknown sequence type: " + name);
}

std::string alphabet_to_string(Alphabet alphabet) {
    switch (alphabet) {
        case Alphabet::DNA:     return "DNA";
        case Alphabet::RNA:     return "RNA";
        case Alphabet::PROTEIN: return "Protein";
        case Alphabet::GENERIC: return "GrammaredSequence";
    }
    return "GrammaredSequence";
}

void validate_alphabet(const std::string& chars, Alphabet alphabet) {
    for (size_t i = 0; i < chars.size(); ++i) {
        if (!is_allowed(chars[i], alphabet)) {
            throw std::invalid_argument(
                "Invalid character '" + std::string(1, chars[i]) + "' at position " +
                std::to_string(i) + " for " + alphabet_to_string(alphabet) + " sequence");
        }
    }
}

// ============================================================================
// Sequence
// ============================================================================

Sequence::Sequence(
    std::string chars,
    std::optional<Metadata> metadata,
    std::optional<PositionalMetadata> positional_metadata,
    Alphabet alphabet
) : chars_(std::move(chars)),
    metadata_(std::move(metadata)),
    positional_metadata_(std::move(positional_metadata)),
    alphabet_(alphabet) {

    if (positional_metadata_) {
        for (const auto& [key, values] : *positional_metadata_) {
            if (values.size() != chars_.size()) {
                throw std::invalid_argument(
                    "Positional metadata '" + key + "' has length " +
                    std::to_string(values.size()) + ", which does not match sequence length " +
                    std::to_string(chars_.size()));
            }
        }
    }
}

bool Sequence::operator==(const Sequence& other) const {
    return chars_ == other.chars_ &&
           metadata_ == other.metadata_ &&
           positional_metadata_ == other.positional_metadata_ &&
           alphabet_ == other.alphabet_;
}

SequenceFactory make_sequence_factory(Alphabet alphabet) {
    return [alphabet](const std::string& chars,
                      std::optional<Metadata> metadata,
                      std::optional<PositionalMetadata> positional_metadata) {
        validate_alphabet(chars, alphabet);
        return Sequence(chars, std::move(metadata), std::move(positional_metadata), alphabet);
    };
}

// ============================================================================
// TabularMSA
// ============================================================================

TabularMSA::TabularMSA(
    std::vector<Sequence> sequences,
    Metadata metadata,
    std::optional<PositionalMetadata> positional_metadata,
    std::vector<std::string> index
) : sequences_(std::move(sequences)),
    metadata_(std::move(metadata)),
    positional_metadata_(std::move(positional_metadata)),
    index_(std::move(index)) {

    if (!sequences_.empty()) {
        position_count_ = sequences_.front().size();
    }

    for (size_t i = 0; i < sequences_.size(); ++i) {
        if (sequences_[i].size() != position_count_) {
            throw std::invalid_argument(
                "Sequence at index " + std::to_string(i) + " has length " +
                std::to_string(sequences_[i].size()) + ", expected length " +
                std::to_string(position_count_) + ". All sequences must be of equal length.");
        }
    }

    if (positional_metadata_) {
        for (const auto& [key, values] : *positional_metadata_) {
            if (values.size() != position_count_) {
                throw std::invalid_argument(
                    "Positional metadata '" + key + "' has length " +
                    std::to_string(values.size()) + ", which does not match the number of positions (" +
                    std::to_string(position_count_) + ")");
            }
        }
    }

    if (index_.size() != sequences_.size()) {
        throw std::invalid_argument(
            "Index length (" + std::to_string(index_.size()) +
            ") must match the number of sequences (" + std::to_string(sequences_.size()) + ")");
    }

    for (size_t i = 0; i < index_.size(); ++i) {
        if (!label_to_row_.emplace(index_[i], i).second) {
            throw std::invalid_argument("Duplicate index label: " + index_[i]);
        }
    }
}

const Sequence& TabularMSA::at(const std::string& label) const {
    auto it = label_to_row_.find(label);
    if (it == label_to_row_.end()) {
        throw std::out_of_range("No sequence with label: " + label);
    }
    return sequences_[it->second];
}

std::string TabularMSA::column(size_t position) const {
    if (position >= position_count_) {
        throw std::out_of_range("Position " + std::to_string(position) +
                                " out of range for alignment with " +
                                std::to_string(position_count_) + " positions");
    }

    std::string result;
    result.reserve(sequences_.size());
    for (const auto& seq : sequences_) {
        result += seq[position];
    }
    return result;
}

Alphabet TabularMSA::alphabet() const {
    if (sequences_.empty()) return Alphabet::GENERIC;
    return sequences_.front().alphabet();
}

bool TabularMSA::operator==(const TabularMSA& other) const {
    return sequences_ == other.sequences_ &&
           metadata_ == other.metadata_ &&
           positional_metadata_ == other.positional_metadata_ &&
           index_ == other.index_;
}

AlignmentFactory default_alignment_factory() {
    return [](std::vector<Sequence> sequences,
              Metadata metadata,
              std::optional<PositionalMetadata> positional_metadata,
              std::vector<std::string> index) {
        return TabularMSA(std::move(sequences), std::move(metadata),
                          std::move(positional_metadata), std::move(index));
    };
}

} // namespace stockholm
