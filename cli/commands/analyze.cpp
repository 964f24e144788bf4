#include "commands.h"

#include <iostream>
#include <optional>

#include "commands/input_utils.h"
#include "protscope/engine/analysis_engine.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/report_writer.h"

namespace protscope {
namespace commands {

int analyze(const std::string& input, const std::string& output_path, const GlobalFlags& flags) {
    try {
        std::optional<function::ReferenceFunctionTable> loaded;
        const auto& reference = SelectReferenceTable(flags.reference_path, loaded);

        engine::EngineConfig config;
        config.analysis.smoothing_window = flags.window;
        engine::AnalysisEngine engine(reference, config);

        SequenceInput resolved = ResolveSequenceArgument(input);
        io::Sequence seq = engine.validate(resolved.raw);

        print_info("Analyzing " + resolved.name + " (" + std::to_string(seq.size()) +
                       " residues)\n",
                   flags.quiet);

        AnalysisResult result = engine.analyze_full(seq);
        std::cout << io::format_analysis(result, resolved.name);

        if (!output_path.empty()) {
            io::write_summary_tsv(output_path, {resolved.name}, {result});
            print_success("Summary written to " + output_path, flags.quiet);
        }
        return 0;
    } catch (const errors::ProtscopeError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Analyze command failed: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace protscope
