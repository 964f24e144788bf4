#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace protscope {
namespace io {

/**
 * A validated protein sequence.
 *
 * Holds only canonical upper-case one-letter codes and is never empty.
 * Instances are produced by validate() and are immutable afterwards.
 * A default-constructed Sequence is an empty placeholder that every
 * analyzer rejects with EmptySequenceError.
 */
class Sequence {
public:
    Sequence() = default;

    const std::string& residues() const { return residues_; }
    std::string_view view() const { return residues_; }
    std::size_t size() const { return residues_.size(); }
    bool empty() const { return residues_.empty(); }
    char operator[](std::size_t i) const { return residues_[i]; }

    std::string::const_iterator begin() const { return residues_.begin(); }
    std::string::const_iterator end() const { return residues_.end(); }

    bool operator==(const Sequence& other) const { return residues_ == other.residues_; }
    bool operator!=(const Sequence& other) const { return residues_ != other.residues_; }

private:
    explicit Sequence(std::string residues) : residues_(std::move(residues)) {}

    friend Sequence validate(std::string_view raw);

    std::string residues_;
};

/**
 * Normalize and validate raw user input.
 *
 * Removes every whitespace character (leading, trailing and interior),
 * upper-cases letters, and checks each remaining character against the
 * 20-letter alphabet.
 *
 * @param raw Raw text as typed or pasted
 * @return Canonical sequence
 * @throws InvalidSequenceError if nothing remains after stripping, or on the
 *         first non-canonical character (reported with its offset in raw)
 *
 * Example:
 *   validate(" acd\nEF ").residues()  // -> "ACDEF"
 *   validate("ABCXYZ123")              // throws: 'B' at offset 1
 */
Sequence validate(std::string_view raw);

}  // namespace io
}  // namespace protscope
