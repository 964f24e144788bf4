/**
 * Mutation comparison.
 *
 * Analyzes an original and a mutated sequence independently and reports
 * how the aggregate properties shift. Insertions and deletions are valid
 * input: only sequence-level values are differenced.
 */

#pragma once

#include "protscope/common/result_types.h"
#include "protscope/engine/pipeline.h"
#include "protscope/modules/function/reference_table.h"

namespace protscope {
namespace mutation {

/**
 * Difference two finished analyses (mutated - original).
 */
MutationDelta diff(AnalysisResult original, AnalysisResult mutated);

/**
 * Analyze both sequences and difference the results.
 *
 * compare(s, s) yields all-zero deltas and function_changed == false.
 *
 * @throws EmptySequenceError if either sequence is empty
 */
MutationDelta compare(const io::Sequence& original, const io::Sequence& mutated,
                      const function::ReferenceFunctionTable& reference,
                      const engine::AnalysisOptions& options = engine::AnalysisOptions());

}  // namespace mutation
}  // namespace protscope
