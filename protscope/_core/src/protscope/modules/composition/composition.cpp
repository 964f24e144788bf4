#include "composition.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/tables/residue_scales.h"
#include <array>
#include <string_view>
#include <utility>

namespace protscope {
namespace composition {

namespace {

double class_fraction(const io::Sequence& seq, std::string_view members) {
    std::size_t hits = 0;
    for (char residue : seq) {
        if (io::in_class(residue, members)) {
            hits++;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(seq.size());
}

}  // namespace

CompositionSummary summarize(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Composition summary");
    }

    CompositionSummary summary;
    summary.length = seq.size();
    summary.hydrophobic_fraction = class_fraction(seq, tables::kHydrophobicResidues);
    summary.polar_fraction = class_fraction(seq, tables::kPolarResidues);
    summary.charged_fraction = class_fraction(seq, tables::kChargedResidues);

    double weight = tables::kWaterMass;
    for (char residue : seq) {
        weight += tables::residue_mass(residue);
    }
    summary.molecular_weight = weight;

    return summary;
}

DomainCall call_domain(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Domain call");
    }

    const std::array<std::pair<const char*, std::string_view>, 3> classes = {{
        {"transmembrane domain", tables::kTransmembraneResidues},
        {"catalytic domain", tables::kCatalyticResidues},
        {"signal peptide", tables::kSignalPeptideResidues},
    }};

    DomainCall call;
    call.domain = classes[0].first;
    call.score = class_fraction(seq, classes[0].second);
    for (std::size_t i = 1; i < classes.size(); i++) {
        const double score = class_fraction(seq, classes[i].second);
        if (score > call.score) {
            call.domain = classes[i].first;
            call.score = score;
        }
    }

    call.confident = call.score >= kDomainCallThreshold;
    if (!call.confident) {
        call.domain = "no clear domain";
    }
    return call;
}

}  // namespace composition
}  // namespace protscope
