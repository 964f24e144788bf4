/**
 * Engine entry points for presentation layers (CLI, Python bindings).
 *
 * Exposes validate, analyze_full, compare and the reference labels. The
 * reference table is injected and only read; one engine may serve
 * concurrent requests.
 */

#pragma once

#include "pipeline.h"
#include "protscope/common/result_types.h"
#include "protscope/io/sequence.h"
#include "protscope/modules/function/reference_table.h"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace protscope {
namespace engine {

struct EngineConfig {
    AnalysisOptions analysis;
    size_t num_threads = 0;  // analyze_batch workers, 0 = hardware concurrency
};

class AnalysisEngine {
public:
    /**
     * @param reference Reference function table; must outlive the engine
     * @param config    Windows and batch thread count
     * @throws ValidationError if a configured window is not a positive odd number
     * @throws DimensionError if reference vectors are not kEmbeddingDim long
     */
    explicit AnalysisEngine(const function::ReferenceFunctionTable& reference,
                            EngineConfig config = EngineConfig());

    // The engine keeps a reference, so a temporary table would dangle.
    AnalysisEngine(function::ReferenceFunctionTable&& reference,
                   EngineConfig config = EngineConfig()) = delete;

    // Uses the built-in reference table.
    AnalysisEngine();

    io::Sequence validate(std::string_view raw) const;

    AnalysisResult analyze_full(const io::Sequence& seq) const;

    MutationDelta compare(const io::Sequence& original, const io::Sequence& mutated) const;

    /**
     * Analyze many sequences on a worker pool.
     *
     * @return Results in input order
     */
    std::vector<AnalysisResult> analyze_batch(const std::vector<io::Sequence>& sequences) const;

    // Reference labels in table order, for display only.
    std::vector<std::string> known_labels() const;

    const function::ReferenceFunctionTable& reference() const { return reference_; }
    const EngineConfig& config() const { return config_; }

private:
    const function::ReferenceFunctionTable& reference_;
    EngineConfig config_;
};

}  // namespace engine
}  // namespace protscope
