#include "mutation_compare.h"
#include <utility>

namespace protscope {
namespace mutation {

MutationDelta diff(AnalysisResult original, AnalysisResult mutated) {
    MutationDelta delta;

    delta.hydrophobicity_delta = mutated.hydrophobicity.mean - original.hydrophobicity.mean;

    delta.structure_delta.helix = mutated.structure.helix - original.structure.helix;
    delta.structure_delta.sheet = mutated.structure.sheet - original.structure.sheet;
    delta.structure_delta.coil = mutated.structure.coil - original.structure.coil;

    delta.original_label = original.function.label();
    delta.mutated_label = mutated.function.label();
    delta.original_confidence = original.function.confidence();
    delta.mutated_confidence = mutated.function.confidence();
    delta.function_changed = delta.original_label != delta.mutated_label;

    delta.length_delta = static_cast<long>(mutated.sequence.size()) -
                         static_cast<long>(original.sequence.size());
    delta.hydrophobic_fraction_delta =
        mutated.composition.hydrophobic_fraction - original.composition.hydrophobic_fraction;
    delta.polar_fraction_delta =
        mutated.composition.polar_fraction - original.composition.polar_fraction;
    delta.charged_fraction_delta =
        mutated.composition.charged_fraction - original.composition.charged_fraction;
    delta.molecular_weight_delta =
        mutated.composition.molecular_weight - original.composition.molecular_weight;

    delta.original = std::move(original);
    delta.mutated = std::move(mutated);
    return delta;
}

MutationDelta compare(const io::Sequence& original, const io::Sequence& mutated,
                      const function::ReferenceFunctionTable& reference,
                      const engine::AnalysisOptions& options) {
    AnalysisResult original_result = engine::analyze_full(original, reference, options);
    AnalysisResult mutated_result = engine::analyze_full(mutated, reference, options);
    return diff(std::move(original_result), std::move(mutated_result));
}

}  // namespace mutation
}  // namespace protscope
