#include "pipeline.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/errors/validators.h"

namespace protscope {
namespace engine {

AnalysisResult analyze_full(const io::Sequence& seq,
                            const function::ReferenceFunctionTable& reference,
                            const AnalysisOptions& options) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Analysis pipeline");
    }
    validation::validate_odd(options.smoothing_window, "smoothing_window");
    validation::validate_odd(options.state_window, "state_window");

    AnalysisResult result;
    result.sequence = seq;

    result.hydrophobicity = hydrophobicity::analyze(seq);
    result.smoothed_hydrophobicity =
        hydrophobicity::smooth(result.hydrophobicity.per_residue, options.smoothing_window);

    result.structure = structure::predict(seq);
    result.states = structure::assign_states(seq, options.state_window);

    result.embedding = embedding::embed(seq, result.hydrophobicity.mean);
    result.function = function::predict(result.embedding, reference);

    result.composition = composition::summarize(seq);
    result.domain_call = composition::call_domain(seq);
    result.domains = domains::scan(seq);

    return result;
}

}  // namespace engine
}  // namespace protscope
