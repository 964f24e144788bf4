#include "commands.h"

#include <iostream>
#include <optional>

#include "commands/input_utils.h"
#include "protscope/engine/analysis_engine.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/errors/validators.h"
#include "protscope/io/fasta_reader.h"
#include "protscope/io/report_writer.h"

namespace protscope {
namespace commands {

int batch(const std::string& fasta_path, const std::string& output_path, size_t threads,
          const GlobalFlags& flags) {
    try {
        validation::validate_file_exists(fasta_path, "FASTA file");
        validation::validate_output_path(output_path);

        std::optional<function::ReferenceFunctionTable> loaded;
        const auto& reference = SelectReferenceTable(flags.reference_path, loaded);

        engine::EngineConfig config;
        config.analysis.smoothing_window = flags.window;
        config.num_threads = threads;
        engine::AnalysisEngine engine(reference, config);

        auto records = io::read_fasta(fasta_path);
        print_field("Input", fasta_path, flags.quiet);
        print_field("Records", records.size(), flags.quiet);

        // Validate everything up front so no partial output is written
        std::vector<std::string> ids;
        std::vector<io::Sequence> sequences;
        ids.reserve(records.size());
        sequences.reserve(records.size());
        int invalid = 0;
        for (const auto& record : records) {
            try {
                sequences.push_back(engine.validate(record.raw));
                ids.push_back(record.name);
            } catch (const errors::InvalidSequenceError& e) {
                std::cerr << record.name << ": " << e.what() << "\n";
                ++invalid;
            }
        }
        if (invalid > 0) {
            std::cerr << invalid << " of " << records.size()
                      << " records are invalid; no output written\n";
            return 1;
        }

        auto results = engine.analyze_batch(sequences);
        io::write_summary_tsv(output_path, ids, results);

        print_success("Analyzed " + std::to_string(results.size()) + " sequences -> " +
                          output_path,
                      flags.quiet);
        return 0;
    } catch (const errors::ProtscopeError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Batch command failed: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace protscope
