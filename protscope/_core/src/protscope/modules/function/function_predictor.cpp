#include "function_predictor.h"
#include "protscope/errors/messages.h"
#include <algorithm>
#include <cstddef>

namespace protscope {
namespace function {

FunctionPrediction predict(const embedding::Embedding& query,
                           const ReferenceFunctionTable& reference) {
    if (query.size() != reference.dimension()) {
        throw errors::messages::embedding_dimension_mismatch(query.size(),
                                                             reference.dimension());
    }

    struct Scored {
        std::size_t index;
        double similarity;
    };

    std::vector<Scored> scored;
    scored.reserve(reference.size());
    for (std::size_t i = 0; i < reference.size(); i++) {
        const double sim = embedding::cosine_similarity(query, reference[i].vector);
        scored.push_back({i, std::clamp(sim, 0.0, 1.0)});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.index < b.index;
    });

    FunctionPrediction prediction;
    prediction.candidates.reserve(scored.size());
    for (std::size_t r = 0; r < scored.size(); r++) {
        prediction.candidates.push_back(
            {reference[scored[r].index].label, scored[r].similarity, static_cast<int>(r + 1)});
    }
    return prediction;
}

}  // namespace function
}  // namespace protscope
