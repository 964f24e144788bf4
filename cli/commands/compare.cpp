#include "commands.h"

#include <iostream>
#include <optional>

#include "commands/input_utils.h"
#include "protscope/engine/analysis_engine.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/report_writer.h"

namespace protscope {
namespace commands {

int compare(const std::string& original, const std::string& mutated, const GlobalFlags& flags) {
    try {
        std::optional<function::ReferenceFunctionTable> loaded;
        const auto& reference = SelectReferenceTable(flags.reference_path, loaded);

        engine::EngineConfig config;
        config.analysis.smoothing_window = flags.window;
        engine::AnalysisEngine engine(reference, config);

        SequenceInput original_input = ResolveSequenceArgument(original);
        SequenceInput mutated_input = ResolveSequenceArgument(mutated);

        io::Sequence original_seq = engine.validate(original_input.raw);
        io::Sequence mutated_seq = engine.validate(mutated_input.raw);

        print_info("Original: " + original_input.name + " (" +
                       std::to_string(original_seq.size()) + " residues)",
                   flags.quiet);
        print_info("Mutated:  " + mutated_input.name + " (" +
                       std::to_string(mutated_seq.size()) + " residues)\n",
                   flags.quiet);

        MutationDelta delta = engine.compare(original_seq, mutated_seq);
        std::cout << io::format_delta(delta);
        return 0;
    } catch (const errors::ProtscopeError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Compare command failed: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace protscope
