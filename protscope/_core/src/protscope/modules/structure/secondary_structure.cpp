#include "secondary_structure.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/errors/validators.h"
#include "protscope/tables/residue_scales.h"
#include <algorithm>
#include <cstddef>

namespace protscope {
namespace structure {

StructureComposition predict(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Secondary structure predictor");
    }

    double helix_sum = 0.0;
    double sheet_sum = 0.0;
    double coil_sum = 0.0;
    for (char residue : seq) {
        const tables::Propensity& p = tables::propensity(residue);
        helix_sum += p.helix;
        sheet_sum += p.sheet;
        coil_sum += p.coil;
    }

    StructureComposition composition;
    const double total = helix_sum + sheet_sum + coil_sum;
    if (total <= 0.0) {
        composition.helix = 1.0 / 3.0;
        composition.sheet = 1.0 / 3.0;
        composition.coil = 1.0 / 3.0;
        return composition;
    }

    composition.helix = helix_sum / total;
    composition.sheet = sheet_sum / total;
    composition.coil = coil_sum / total;
    return composition;
}

int StructureStates::count(char state) const {
    return static_cast<int>(std::count(states.begin(), states.end(), state));
}

StructureStates assign_states(const io::Sequence& seq, int window) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Secondary structure predictor");
    }
    validation::validate_odd(window, "window");

    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(seq.size());
    const std::ptrdiff_t half = window / 2;

    StructureStates result;
    result.states.reserve(seq.size());
    result.confidence.reserve(seq.size());

    for (std::ptrdiff_t i = 0; i < n; i++) {
        const std::ptrdiff_t lo = std::max<std::ptrdiff_t>(0, i - half);
        const std::ptrdiff_t hi = std::min<std::ptrdiff_t>(n, i + half + 1);

        double helix = 0.0;
        double sheet = 0.0;
        double coil = 0.0;
        for (std::ptrdiff_t j = lo; j < hi; j++) {
            const tables::Propensity& p = tables::propensity(seq[static_cast<std::size_t>(j)]);
            helix += p.helix;
            sheet += p.sheet;
            coil += p.coil;
        }
        const double span = static_cast<double>(hi - lo);
        helix /= span;
        sheet /= span;
        coil /= span;

        char state = 'H';
        double best = helix;
        if (sheet > best) {
            state = 'E';
            best = sheet;
        }
        if (coil > best) {
            state = 'C';
            best = coil;
        }

        const double total = helix + sheet + coil;
        result.states.push_back(state);
        result.confidence.push_back(total > 0.0 ? best / total : 1.0 / 3.0);
    }

    return result;
}

}  // namespace structure
}  // namespace protscope
