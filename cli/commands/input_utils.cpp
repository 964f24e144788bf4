#include "input_utils.h"

#include <filesystem>
#include <sstream>
#include <system_error>

#include "protscope/io/fasta_reader.h"
#include "protscope/io/reference_table_io.h"

namespace protscope {
namespace commands {

SequenceInput ResolveSequenceArgument(const std::string& argument) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(argument, ec)) {
        auto records = io::read_fasta(argument);
        return SequenceInput{records.front().name, records.front().raw};
    }
    if (io::looks_like_fasta(argument)) {
        std::istringstream text(argument);
        auto records = io::parse_fasta(text, "input");
        return SequenceInput{records.front().name, records.front().raw};
    }
    return SequenceInput{"input", argument};
}

const function::ReferenceFunctionTable& SelectReferenceTable(
    const std::string& path, std::optional<function::ReferenceFunctionTable>& holder) {
    if (path.empty()) {
        return function::builtin_reference_table();
    }
    holder.emplace(io::load_reference_table(path));
    return *holder;
}

}  // namespace commands
}  // namespace protscope
