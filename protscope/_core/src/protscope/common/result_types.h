#pragma once

#include "protscope/io/sequence.h"
#include "protscope/modules/composition/composition.h"
#include "protscope/modules/domains/domain_scan.h"
#include "protscope/modules/embedding/embedder.h"
#include "protscope/modules/function/function_predictor.h"
#include "protscope/modules/hydrophobicity/hydrophobicity.h"
#include "protscope/modules/structure/secondary_structure.h"
#include <string>
#include <vector>

namespace protscope {

/**
 * Everything the engine reports for one sequence.
 *
 * Owned by the caller; nothing in here refers back to engine state.
 */
struct AnalysisResult {
    io::Sequence sequence;
    hydrophobicity::HydrophobicityProfile hydrophobicity;
    std::vector<double> smoothed_hydrophobicity;
    structure::StructureComposition structure;
    structure::StructureStates states;
    embedding::Embedding embedding;
    function::FunctionPrediction function;
    composition::CompositionSummary composition;
    composition::DomainCall domain_call;
    std::vector<domains::DomainRegion> domains;
};

/**
 * Per-class change in secondary structure composition (mutated - original).
 */
struct StructureDelta {
    double helix = 0.0;
    double sheet = 0.0;
    double coil = 0.0;
};

/**
 * Aggregate-level differences between an original and a mutated sequence.
 *
 * All deltas are mutated minus original. Per-position differences are not
 * computed, so sequences of different length compare cleanly.
 */
struct MutationDelta {
    AnalysisResult original;
    AnalysisResult mutated;

    double hydrophobicity_delta = 0.0;
    StructureDelta structure_delta;

    bool function_changed = false;
    std::string original_label;
    std::string mutated_label;
    double original_confidence = 0.0;
    double mutated_confidence = 0.0;

    long length_delta = 0;
    double hydrophobic_fraction_delta = 0.0;
    double polar_fraction_delta = 0.0;
    double charged_fraction_delta = 0.0;
    double molecular_weight_delta = 0.0;
};

}  // namespace protscope
