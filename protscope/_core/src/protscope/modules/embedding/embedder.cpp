#include "embedder.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/modules/hydrophobicity/hydrophobicity.h"
#include "protscope/tables/residue_scales.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace protscope {
namespace embedding {

double length_bucket(std::size_t length) {
    if (length < 50) return 0.0;
    if (length < 150) return 0.25;
    if (length < 400) return 0.5;
    if (length < 1000) return 0.75;
    return 1.0;
}

double scaled_hydrophobicity(double mean_hydrophobicity) {
    const double range = tables::kHydrophobicityMax - tables::kHydrophobicityMin;
    const double scaled = (mean_hydrophobicity - tables::kHydrophobicityMin) / range;
    return std::clamp(scaled, 0.0, 1.0);
}

Embedding embed(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Function embedder");
    }
    return embed(seq, hydrophobicity::analyze(seq).mean);
}

Embedding embed(const io::Sequence& seq, double mean_hydrophobicity) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Function embedder");
    }

    std::array<std::size_t, kHistogramDim> counts{};
    for (char residue : seq) {
        counts[static_cast<std::size_t>(io::residue_index(residue))]++;
    }

    Embedding vec(kEmbeddingDim, 0.0);
    const double n = static_cast<double>(seq.size());
    for (std::size_t k = 0; k < kHistogramDim; k++) {
        vec[k] = static_cast<double>(counts[k]) / n;
    }
    vec[kLengthFeature] = kDerivedFeatureWeight * length_bucket(seq.size());
    vec[kHydrophobicityFeature] = kDerivedFeatureWeight * scaled_hydrophobicity(mean_hydrophobicity);

    return vec;
}

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw errors::DimensionError("cosine similarity operand", std::to_string(b.size()),
                                     std::to_string(a.size()));
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t d = 0; d < a.size(); d++) {
        dot += a[d] * b[d];
        norm_a += a[d] * a[d];
        norm_b += b[d] * b[d];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace embedding
}  // namespace protscope
