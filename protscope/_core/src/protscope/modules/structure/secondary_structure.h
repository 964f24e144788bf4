/**
 * Secondary structure prediction from Chou-Fasman propensities.
 *
 * Two views of the same table:
 * - predict():       sequence-level composition {helix, sheet, coil}
 * - assign_states(): per-residue H/E/C call from a centred window
 */

#pragma once

#include "protscope/io/sequence.h"
#include <string>
#include <vector>

namespace protscope {
namespace structure {

/**
 * Proportions of helix, sheet and coil.
 *
 * Invariant: all three are non-negative, share one denominator, and sum to
 * 1.0 within floating-point tolerance.
 */
struct StructureComposition {
    double helix = 0.0;
    double sheet = 0.0;
    double coil = 0.0;

    double sum() const { return helix + sheet + coil; }
};

/**
 * Predict secondary structure composition.
 *
 * Sums each class's propensity over all residues and divides every sum by
 * the grand total of all three. A zero grand total yields an equal 1/3 split.
 *
 * @param seq Validated sequence
 * @return Composition summing to 1.0
 * @throws EmptySequenceError if seq is empty
 */
StructureComposition predict(const io::Sequence& seq);

// Default window for assign_states().
constexpr int kStateWindow = 7;

/**
 * Per-residue secondary structure call.
 *
 * states[i] is 'H', 'E' or 'C'; confidence[i] is the winning class's share
 * of the three window-averaged propensities, in (0, 1].
 */
struct StructureStates {
    std::string states;
    std::vector<double> confidence;

    int count(char state) const;
};

/**
 * Assign a state to every residue.
 *
 * For each position, averages the helix/sheet/coil propensities over the
 * residues of a centred window that fall inside the sequence and picks the
 * largest. Ties resolve helix, then sheet, then coil.
 *
 * @param seq    Validated sequence
 * @param window Odd window size (default 7)
 * @throws EmptySequenceError if seq is empty
 * @throws ValidationError if window is even or < 1
 *
 * Example:
 *   assign_states(validate("EEEEEEE")).states  // -> "HHHHHHH"
 */
StructureStates assign_states(const io::Sequence& seq, int window = kStateWindow);

}  // namespace structure
}  // namespace protscope
