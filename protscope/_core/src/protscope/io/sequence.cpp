#include "sequence.h"
#include "amino_acids.h"
#include "protscope/errors/protscope_error.h"
#include <cctype>

namespace protscope {
namespace io {

Sequence validate(std::string_view raw) {
    std::string residues;
    residues.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char c = raw[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        const char upper = to_upper_residue(c);
        if (!is_canonical(upper)) {
            throw errors::InvalidSequenceError(c, i);
        }
        residues.push_back(upper);
    }

    if (residues.empty()) {
        throw errors::InvalidSequenceError();
    }

    return Sequence(std::move(residues));
}

}  // namespace io
}  // namespace protscope
