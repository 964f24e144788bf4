#include "commands.h"

#include <iostream>
#include <optional>

#include "commands/input_utils.h"
#include "protscope/engine/analysis_engine.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/reference_table_io.h"

namespace protscope {
namespace commands {

int labels(bool dump, const GlobalFlags& flags) {
    try {
        std::optional<function::ReferenceFunctionTable> loaded;
        const auto& reference = SelectReferenceTable(flags.reference_path, loaded);
        engine::AnalysisEngine engine(reference);

        if (dump) {
            io::write_reference_table(std::cout, engine.reference());
            return 0;
        }

        print_info(flags.reference_path.empty() ? "Built-in reference table:"
                                                : "Reference table " + flags.reference_path + ":",
                   flags.quiet);
        for (const auto& label : engine.known_labels()) {
            std::cout << label << "\n";
        }
        return 0;
    } catch (const errors::ProtscopeError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Labels command failed: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace protscope
