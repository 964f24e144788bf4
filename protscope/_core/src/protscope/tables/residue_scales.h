/**
 * Fixed per-residue lookup tables.
 *
 * All tables are indexed by io::residue_index() and are compile-time
 * constants; nothing here is recomputed per call.
 */

#pragma once

#include "protscope/io/amino_acids.h"
#include <array>
#include <string_view>

namespace protscope {
namespace tables {

/**
 * Kyte-Doolittle hydropathy index (J. Mol. Biol. 157:105, 1982).
 * Range -4.5 (R) to +4.5 (I).
 */
constexpr std::array<double, io::kNumAminoAcids> kKyteDoolittle = {
    1.8,   // A
    2.5,   // C
    -3.5,  // D
    -3.5,  // E
    2.8,   // F
    -0.4,  // G
    -3.2,  // H
    4.5,   // I
    -3.9,  // K
    3.8,   // L
    1.9,   // M
    -3.5,  // N
    -1.6,  // P
    -3.5,  // Q
    -4.5,  // R
    -0.8,  // S
    -0.7,  // T
    4.2,   // V
    -0.9,  // W
    -1.3,  // Y
};

constexpr double kHydrophobicityMin = -4.5;
constexpr double kHydrophobicityMax = 4.5;

struct Propensity {
    double helix;
    double sheet;
    double coil;
};

/**
 * Chou-Fasman conformational parameters P(a), P(b), P(turn).
 * Turn propensity stands in for coil. Relative likelihoods, not probabilities.
 */
constexpr std::array<Propensity, io::kNumAminoAcids> kChouFasman = {{
    {1.42, 0.83, 0.66},  // A
    {0.70, 1.19, 1.19},  // C
    {1.01, 0.54, 1.46},  // D
    {1.51, 0.37, 0.74},  // E
    {1.13, 1.38, 0.60},  // F
    {0.57, 0.75, 1.56},  // G
    {1.00, 0.87, 0.95},  // H
    {1.08, 1.60, 0.47},  // I
    {1.16, 0.74, 1.01},  // K
    {1.21, 1.30, 0.59},  // L
    {1.45, 1.05, 0.60},  // M
    {0.67, 0.89, 1.56},  // N
    {0.57, 0.55, 1.52},  // P
    {1.11, 1.10, 0.98},  // Q
    {0.98, 0.93, 0.95},  // R
    {0.77, 0.75, 1.43},  // S
    {0.83, 1.19, 0.96},  // T
    {1.06, 1.70, 0.50},  // V
    {1.08, 1.37, 0.96},  // W
    {0.69, 1.47, 1.14},  // Y
}};

/**
 * Average residue masses in Daltons (free amino acid minus water).
 */
constexpr std::array<double, io::kNumAminoAcids> kResidueMass = {
    71.0788,   // A
    103.1388,  // C
    115.0886,  // D
    129.1155,  // E
    147.1766,  // F
    57.0519,   // G
    137.1411,  // H
    113.1594,  // I
    128.1741,  // K
    113.1594,  // L
    131.1926,  // M
    114.1038,  // N
    97.1167,   // P
    128.1307,  // Q
    156.1875,  // R
    87.0782,   // S
    101.1051,  // T
    99.1326,   // V
    186.2132,  // W
    163.1760,  // Y
};

constexpr double kWaterMass = 18.01528;

// Residue classes used by the composition summary and the domain scan.
constexpr std::string_view kHydrophobicResidues = "VILMFYW";
constexpr std::string_view kPolarResidues = "STNQ";
constexpr std::string_view kChargedResidues = "DEKR";

// Residue classes used by the functional-domain call.
constexpr std::string_view kTransmembraneResidues = "LVIFW";
constexpr std::string_view kCatalyticResidues = "DEHRK";
constexpr std::string_view kSignalPeptideResidues = "ACG";

inline double hydrophobicity(char residue) {
    return kKyteDoolittle[static_cast<std::size_t>(io::residue_index(residue))];
}

inline const Propensity& propensity(char residue) {
    return kChouFasman[static_cast<std::size_t>(io::residue_index(residue))];
}

inline double residue_mass(char residue) {
    return kResidueMass[static_cast<std::size_t>(io::residue_index(residue))];
}

}  // namespace tables
}  // namespace protscope
