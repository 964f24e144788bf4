/**
 * Single-sequence analysis pipeline.
 *
 * Runs every analyzer on one validated sequence. The analyzers share no
 * intermediate state except that the embedding reuses the hydrophobicity
 * mean computed in the same call.
 */

#pragma once

#include "protscope/common/result_types.h"
#include "protscope/modules/function/reference_table.h"
#include "protscope/modules/structure/secondary_structure.h"

namespace protscope {
namespace engine {

// Default window for the smoothed hydrophobicity profile.
constexpr int kDefaultSmoothingWindow = 9;

struct AnalysisOptions {
    int smoothing_window = kDefaultSmoothingWindow;
    int state_window = structure::kStateWindow;
};

/**
 * Produce the full AnalysisResult for one sequence.
 *
 * Either every field is filled or an exception propagates; there is no
 * partial result.
 *
 * @throws EmptySequenceError if seq is empty
 * @throws ValidationError if a window in options is not a positive odd number
 * @throws DimensionError if the reference table dimension is not kEmbeddingDim
 */
AnalysisResult analyze_full(const io::Sequence& seq,
                            const function::ReferenceFunctionTable& reference,
                            const AnalysisOptions& options = AnalysisOptions());

}  // namespace engine
}  // namespace protscope
