#include "reference_table.h"
#include "protscope/errors/messages.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/tables/residue_scales.h"
#include <algorithm>
#include <array>
#include <unordered_set>

namespace protscope {
namespace function {

ReferenceFunctionTable::ReferenceFunctionTable(std::vector<ReferenceEntry> entries,
                                               const std::string& source)
    : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw errors::EmptyReferenceTableError(source);
    }

    const std::size_t dim = entries_.front().vector.size();
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries_) {
        if (entry.label.empty()) {
            throw errors::ValidationError("Reference table entry has an empty label",
                                          "Give every reference vector a function label");
        }
        if (!seen.insert(entry.label).second) {
            throw errors::ValidationError("label", entry.label, "unique function label");
        }
        if (entry.vector.size() != dim) {
            throw errors::messages::reference_dimension_mismatch(entry.label,
                                                                 entry.vector.size(), dim);
        }
    }
}

std::vector<std::string> ReferenceFunctionTable::labels() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.label);
    }
    return out;
}

bool ReferenceFunctionTable::contains(const std::string& label) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const ReferenceEntry& e) { return e.label == label; });
}

namespace {

using Composition = std::array<double, io::kNumAminoAcids>;

// Relative residue abundances, columns in io::kAlphabet order:
//                         A   C   D   E   F   G   H   I   K   L   M   N   P   Q   R   S   T   V   W   Y
constexpr Composition kEnzyme      = {8,  2,  7,  7,  4,  8,  4,  5,  7,  8,  2,  4,  4,  4,  5,  7,  5,  7,  1,  3};
constexpr Composition kTransport   = {10, 2,  2,  2,  8,  9,  1,  10, 2,  14, 4,  2,  4,  2,  3,  6,  5,  10, 2,  3};
constexpr Composition kSignaling   = {6,  2,  5,  6,  3,  6,  3,  4,  6,  8,  2,  4,  7,  4,  6,  10, 7,  5,  1,  3};
constexpr Composition kNucleicAcid = {6,  1,  4,  5,  2,  9,  3,  3,  14, 6,  2,  4,  4,  4,  12, 7,  5,  4,  1,  2};
constexpr Composition kStructural  = {12, 1,  3,  4,  2,  26, 1,  2,  4,  3,  1,  2,  20, 3,  4,  4,  3,  3,  1,  1};

// Same feature construction as embedding::embed(), from a composition
// instead of a sequence.
embedding::Embedding prototype_embedding(const Composition& weights, double length_bucket) {
    double total = 0.0;
    for (double w : weights) {
        total += w;
    }

    embedding::Embedding vec(embedding::kEmbeddingDim, 0.0);
    double mean_hydrophobicity = 0.0;
    for (std::size_t k = 0; k < embedding::kHistogramDim; k++) {
        vec[k] = weights[k] / total;
        mean_hydrophobicity += vec[k] * tables::kKyteDoolittle[k];
    }
    vec[embedding::kLengthFeature] = embedding::kDerivedFeatureWeight * length_bucket;
    vec[embedding::kHydrophobicityFeature] =
        embedding::kDerivedFeatureWeight * embedding::scaled_hydrophobicity(mean_hydrophobicity);
    return vec;
}

}  // namespace

const ReferenceFunctionTable& builtin_reference_table() {
    static const ReferenceFunctionTable table(
        {
            {"enzyme", prototype_embedding(kEnzyme, 0.5)},
            {"transport", prototype_embedding(kTransport, 0.5)},
            {"signaling", prototype_embedding(kSignaling, 0.25)},
            {"DNA/RNA binding", prototype_embedding(kNucleicAcid, 0.25)},
            {"structural", prototype_embedding(kStructural, 0.75)},
        },
        "built-in");
    return table;
}

}  // namespace function
}  // namespace protscope
