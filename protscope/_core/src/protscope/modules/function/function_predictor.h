/**
 * Nearest-neighbour function prediction.
 *
 * Scores a query embedding against every reference entry with cosine
 * similarity and ranks the entries. There is no trained model; the
 * reference table is the whole of the predictor's knowledge.
 */

#pragma once

#include "reference_table.h"
#include "protscope/modules/embedding/embedder.h"
#include <string>
#include <vector>

namespace protscope {
namespace function {

struct FunctionCandidate {
    std::string label;
    double similarity = 0.0;  // cosine similarity clipped to [0, 1]
    int rank = 0;             // 1-based
};

/**
 * Candidates in non-increasing similarity order.
 *
 * The first candidate is the reported prediction; its similarity doubles
 * as the confidence.
 */
struct FunctionPrediction {
    std::vector<FunctionCandidate> candidates;

    const FunctionCandidate& top() const { return candidates.front(); }
    const std::string& label() const { return top().label; }
    double confidence() const { return top().similarity; }
};

/**
 * Rank every reference entry by similarity to the query.
 *
 * Sort key: similarity descending, then reference insertion order, so
 * equal scores keep the table's order.
 *
 * @param query     Embedding from embedding::embed()
 * @param reference Reference table
 * @return One candidate per reference entry
 * @throws DimensionError if query length differs from reference.dimension()
 */
FunctionPrediction predict(const embedding::Embedding& query,
                           const ReferenceFunctionTable& reference);

}  // namespace function
}  // namespace protscope
