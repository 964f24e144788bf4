#include "analysis_engine.h"
#include "protscope/common/thread_pool.h"
#include "protscope/errors/messages.h"
#include "protscope/errors/validators.h"
#include "protscope/modules/embedding/embedder.h"
#include "protscope/modules/mutation/mutation_compare.h"

namespace protscope {
namespace engine {

AnalysisEngine::AnalysisEngine(const function::ReferenceFunctionTable& reference,
                               EngineConfig config)
    : reference_(reference), config_(config) {
    validation::validate_odd(config_.analysis.smoothing_window, "smoothing_window");
    validation::validate_odd(config_.analysis.state_window, "state_window");

    // Reject an incompatible table at construction.
    if (reference_.dimension() != embedding::kEmbeddingDim) {
        throw errors::messages::embedding_dimension_mismatch(embedding::kEmbeddingDim,
                                                             reference_.dimension());
    }
}

AnalysisEngine::AnalysisEngine() : AnalysisEngine(function::builtin_reference_table()) {}

io::Sequence AnalysisEngine::validate(std::string_view raw) const {
    return io::validate(raw);
}

AnalysisResult AnalysisEngine::analyze_full(const io::Sequence& seq) const {
    return engine::analyze_full(seq, reference_, config_.analysis);
}

MutationDelta AnalysisEngine::compare(const io::Sequence& original,
                                      const io::Sequence& mutated) const {
    return mutation::compare(original, mutated, reference_, config_.analysis);
}

std::vector<AnalysisResult> AnalysisEngine::analyze_batch(
    const std::vector<io::Sequence>& sequences) const {
    std::vector<AnalysisResult> results(sequences.size());

    threading::ThreadPool pool(config_.num_threads);
    pool.parallel_for(sequences.size(), [&](int, size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) {
            results[i] = engine::analyze_full(sequences[i], reference_, config_.analysis);
        }
    });

    return results;
}

std::vector<std::string> AnalysisEngine::known_labels() const {
    return reference_.labels();
}

}  // namespace engine
}  // namespace protscope
