/**
 * Reference function table file format.
 *
 * One entry per line:
 *   label<TAB>v1 v2 ... vN
 * Values may be separated by spaces, tabs or commas. Labels may contain
 * spaces (the first TAB ends the label). Lines starting with '#' and blank
 * lines are ignored. Every vector must have embedding::kEmbeddingDim
 * non-negative values.
 *
 * Example:
 *   # label    A C D ... Y  length  hydrophobicity
 *   enzyme	0.08 0.02 0.07 ...
 */

#pragma once

#include "protscope/modules/function/reference_table.h"
#include <istream>
#include <ostream>
#include <string>

namespace protscope {
namespace io {

/**
 * @param in     Input stream
 * @param source Name used in error messages
 * @throws FormatError on a malformed line, negative value or duplicate label
 * @throws DimensionError if a vector has the wrong length
 * @throws EmptyReferenceTableError if no entries remain
 */
function::ReferenceFunctionTable parse_reference_table(std::istream& in,
                                                       const std::string& source);

/**
 * @throws FileNotFoundError if path cannot be opened
 * @throws (as parse_reference_table)
 */
function::ReferenceFunctionTable load_reference_table(const std::string& path);

/**
 * Write a table in the format parse_reference_table() reads.
 */
void write_reference_table(std::ostream& out, const function::ReferenceFunctionTable& table);

}  // namespace io
}  // namespace protscope
