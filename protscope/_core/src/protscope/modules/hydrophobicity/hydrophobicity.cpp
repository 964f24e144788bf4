#include "hydrophobicity.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/errors/validators.h"
#include "protscope/tables/residue_scales.h"
#include <algorithm>
#include <cstddef>

namespace protscope {
namespace hydrophobicity {

HydrophobicityProfile analyze(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Hydrophobicity analyzer");
    }

    HydrophobicityProfile profile;
    profile.per_residue.reserve(seq.size());

    double sum = 0.0;
    for (char residue : seq) {
        const double value = tables::hydrophobicity(residue);
        profile.per_residue.push_back(value);
        sum += value;
    }
    profile.mean = sum / static_cast<double>(seq.size());

    return profile;
}

std::vector<double> smooth(const std::vector<double>& per_residue, int window) {
    validation::validate_odd(window, "window");

    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(per_residue.size());
    const std::ptrdiff_t half = window / 2;

    // Prefix sums keep this linear in the sequence length.
    std::vector<double> prefix(per_residue.size() + 1, 0.0);
    for (std::ptrdiff_t i = 0; i < n; i++) {
        prefix[i + 1] = prefix[i] + per_residue[i];
    }

    std::vector<double> smoothed(per_residue.size());
    for (std::ptrdiff_t i = 0; i < n; i++) {
        const std::ptrdiff_t lo = std::max<std::ptrdiff_t>(0, i - half);
        const std::ptrdiff_t hi = std::min<std::ptrdiff_t>(n, i + half + 1);
        smoothed[i] = (prefix[hi] - prefix[lo]) / static_cast<double>(hi - lo);
    }
    return smoothed;
}

}  // namespace hydrophobicity
}  // namespace protscope
