/**
 * FASTA reader for CLI input.
 *
 * Lines starting with '>' start a record; following lines are concatenated
 * as raw sequence text. Residues are not validated here: records go through
 * io::validate() so that invalid characters are reported the same way as
 * for typed input.
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

namespace protscope {
namespace io {

struct FastaRecord {
    std::string name;  // header text after '>', up to the first whitespace
    std::string raw;   // concatenated sequence lines, unvalidated
};

/**
 * Parse FASTA text.
 *
 * Strips a UTF-8 BOM, skips blank lines, and names headerless or
 * empty-header records "record_<n>" (1-based).
 *
 * @param in     Input stream
 * @param source Name used in error messages
 * @throws FormatError if there are no records or a record has no sequence
 */
std::vector<FastaRecord> parse_fasta(std::istream& in, const std::string& source);

/**
 * @throws FileNotFoundError if path cannot be opened
 * @throws FormatError as parse_fasta()
 */
std::vector<FastaRecord> read_fasta(const std::string& path);

/**
 * True if text looks like FASTA (first non-blank character is '>').
 */
bool looks_like_fasta(const std::string& text);

}  // namespace io
}  // namespace protscope
