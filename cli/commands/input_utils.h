#pragma once

#include <optional>
#include <string>

#include "protscope/modules/function/reference_table.h"

namespace protscope {
namespace commands {

struct SequenceInput {
    std::string name;  // FASTA record name, or "input" for typed text
    std::string raw;   // unvalidated residue text
};

/**
 * Resolve a command argument to sequence text.
 *
 * An argument naming an existing file is read as FASTA and its first
 * record is used. Text starting with '>' is parsed as FASTA the same way.
 * Anything else is taken as the sequence itself.
 *
 * @throws FormatError if the file or text is not valid FASTA
 */
SequenceInput ResolveSequenceArgument(const std::string& argument);

/**
 * Load the reference table named by path, or the built-in table when
 * path is empty. The returned table lives as long as holder.
 */
const function::ReferenceFunctionTable& SelectReferenceTable(
    const std::string& path, std::optional<function::ReferenceFunctionTable>& holder);

}  // namespace commands
}  // namespace protscope
