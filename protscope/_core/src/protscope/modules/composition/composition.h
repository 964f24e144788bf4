/**
 * Physicochemical composition and the composition-based domain call.
 */

#pragma once

#include "protscope/io/sequence.h"
#include <cstddef>
#include <string>

namespace protscope {
namespace composition {

struct CompositionSummary {
    std::size_t length = 0;
    double hydrophobic_fraction = 0.0;  // VILMFYW
    double polar_fraction = 0.0;        // STNQ
    double charged_fraction = 0.0;      // DEKR
    double molecular_weight = 0.0;      // Daltons
};

/**
 * Summarize residue classes and molecular weight.
 *
 * Molecular weight is the sum of average residue masses plus one water.
 *
 * @throws EmptySequenceError if seq is empty
 */
CompositionSummary summarize(const io::Sequence& seq);

// Below this score no domain class is reported.
constexpr double kDomainCallThreshold = 0.1;

struct DomainCall {
    std::string domain;       // "transmembrane domain", ..., or "no clear domain"
    double score = 0.0;       // fraction of residues in the winning class
    bool confident = false;   // score >= kDomainCallThreshold
};

/**
 * Call the dominant functional-domain class.
 *
 * Scores are fractions of transmembrane (LVIFW), catalytic (DEHRK) and
 * signal-peptide (ACG) residues; ties go to the earlier class in that order.
 *
 * @throws EmptySequenceError if seq is empty
 */
DomainCall call_domain(const io::Sequence& seq);

}  // namespace composition
}  // namespace protscope
