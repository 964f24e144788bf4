/**
 * Hydrophobicity analysis.
 *
 * Maps each residue to its Kyte-Doolittle value and aggregates the
 * per-residue scores into an arithmetic mean.
 */

#pragma once

#include "protscope/io/sequence.h"
#include <vector>

namespace protscope {
namespace hydrophobicity {

/**
 * Per-residue scores plus their mean.
 *
 * Invariant: per_residue.size() equals the analyzed sequence length.
 */
struct HydrophobicityProfile {
    std::vector<double> per_residue;
    double mean = 0.0;
};

/**
 * Compute the hydrophobicity profile of a sequence.
 *
 * @param seq Validated sequence
 * @return Profile with one score per residue and their mean
 * @throws EmptySequenceError if seq is empty
 *
 * Example:
 *   analyze(validate("IR")).mean  // -> (4.5 + -4.5) / 2 = 0.0
 */
HydrophobicityProfile analyze(const io::Sequence& seq);

/**
 * Centred sliding-window mean of a per-residue profile.
 *
 * Windows are truncated at the sequence ends, so the output has the same
 * length as the input and the first/last values average fewer residues.
 *
 * @param per_residue Per-residue scores
 * @param window      Odd window size (>= 1)
 * @return Smoothed profile (same length as per_residue)
 * @throws ValidationError if window is even or < 1
 */
std::vector<double> smooth(const std::vector<double>& per_residue, int window);

}  // namespace hydrophobicity
}  // namespace protscope
