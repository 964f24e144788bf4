#include "report_writer.h"
#include "protscope/errors/messages.h"
#include "protscope/errors/validators.h"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace protscope {
namespace io {

namespace {

std::string signed_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::showpos << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

}  // namespace

std::string format_analysis(const AnalysisResult& result, const std::string& name) {
    std::ostringstream oss;
    oss << std::fixed;

    if (!name.empty()) {
        oss << "Sequence:        " << name << "\n";
    }
    oss << "Length:          " << result.sequence.size() << " residues\n";
    oss << "Molecular weight: " << std::setprecision(1) << result.composition.molecular_weight
        << " Da\n";
    oss << "Hydrophobicity:  " << std::setprecision(2) << result.hydrophobicity.mean
        << " (Kyte-Doolittle mean)\n";
    oss << "Composition:     hydrophobic " << percent(result.composition.hydrophobic_fraction)
        << ", polar " << percent(result.composition.polar_fraction) << ", charged "
        << percent(result.composition.charged_fraction) << "\n";

    oss << "\nSecondary structure\n";
    oss << "  Helix: " << percent(result.structure.helix) << "\n";
    oss << "  Sheet: " << percent(result.structure.sheet) << "\n";
    oss << "  Coil:  " << percent(result.structure.coil) << "\n";
    oss << "  States: " << result.states.states << "\n";

    oss << "\nPredicted function: " << result.function.label() << " (confidence "
        << std::setprecision(3) << result.function.confidence() << ")\n";
    for (const auto& candidate : result.function.candidates) {
        oss << "  " << candidate.rank << ". " << std::left << std::setw(18) << candidate.label
            << std::right << std::setprecision(4) << candidate.similarity << "\n";
    }

    oss << "\nDomain call: " << result.domain_call.domain;
    if (result.domain_call.confident) {
        oss << " (" << percent(result.domain_call.score) << " of residues)";
    }
    oss << "\n";
    for (const auto& region : result.domains) {
        oss << "  " << region.name << " [" << region.start << "-" << region.end << "] "
            << std::setprecision(1) << region.score << "%: " << region.description << "\n";
    }

    return oss.str();
}

std::string format_delta(const MutationDelta& delta) {
    std::ostringstream oss;
    oss << std::fixed;

    oss << "Length:            " << delta.original.sequence.size() << " -> "
        << delta.mutated.sequence.size() << " (" << std::showpos << delta.length_delta
        << std::noshowpos << ")\n";
    oss << "Hydrophobicity:    " << std::setprecision(2) << delta.original.hydrophobicity.mean
        << " -> " << delta.mutated.hydrophobicity.mean << " ("
        << signed_fixed(delta.hydrophobicity_delta, 3) << ")\n";
    oss << "Helix:             " << signed_fixed(delta.structure_delta.helix * 100.0, 2) << " pts\n";
    oss << "Sheet:             " << signed_fixed(delta.structure_delta.sheet * 100.0, 2) << " pts\n";
    oss << "Coil:              " << signed_fixed(delta.structure_delta.coil * 100.0, 2) << " pts\n";
    oss << "Molecular weight:  " << signed_fixed(delta.molecular_weight_delta, 1) << " Da\n";
    oss << "Hydrophobic:       " << signed_fixed(delta.hydrophobic_fraction_delta * 100.0, 2)
        << " pts\n";
    oss << "Polar:             " << signed_fixed(delta.polar_fraction_delta * 100.0, 2) << " pts\n";
    oss << "Charged:           " << signed_fixed(delta.charged_fraction_delta * 100.0, 2)
        << " pts\n";

    oss << "Function:          " << delta.original_label << " (" << std::setprecision(3)
        << delta.original_confidence << ") -> " << delta.mutated_label << " ("
        << delta.mutated_confidence << ")";
    oss << (delta.function_changed ? "  [CHANGED]" : "  [unchanged]") << "\n";

    return oss.str();
}

void write_summary_header(std::ostream& out) {
    out << "id\tlength\tmean_hydrophobicity\thelix\tsheet\tcoil\tfunction\tconfidence"
           "\tdomain_call\thydrophobic\tpolar\tcharged\tmolecular_weight\n";
}

void write_summary_row(std::ostream& out, const std::string& id, const AnalysisResult& result) {
    out << std::fixed << std::setprecision(6);
    out << id << '\t' << result.sequence.size() << '\t' << result.hydrophobicity.mean << '\t'
        << result.structure.helix << '\t' << result.structure.sheet << '\t'
        << result.structure.coil << '\t' << result.function.label() << '\t'
        << result.function.confidence() << '\t' << result.domain_call.domain << '\t'
        << result.composition.hydrophobic_fraction << '\t'
        << result.composition.polar_fraction << '\t' << result.composition.charged_fraction
        << '\t' << std::setprecision(2) << result.composition.molecular_weight << '\n';
}

void write_summary_tsv(const std::string& path, const std::vector<std::string>& ids,
                       const std::vector<AnalysisResult>& results) {
    validation::validate_output_path(path);
    std::ofstream out(path);
    if (!out.is_open()) {
        throw errors::messages::file_write_error(path, "cannot open for writing");
    }

    write_summary_header(out);
    for (std::size_t i = 0; i < results.size(); i++) {
        write_summary_row(out, ids[i], results[i]);
    }

    if (!out) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

}  // namespace io
}  // namespace protscope
