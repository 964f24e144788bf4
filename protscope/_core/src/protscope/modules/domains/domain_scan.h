/**
 * Motif and sliding-window domain scan.
 *
 * Reports:
 * - exact matches of a few known motifs (first occurrence each)
 * - transmembrane stretches: 10-residue windows with >= 7 hydrophobic residues
 * - charged stretches:       10-residue windows with >= 5 charged residues
 *
 * Overlapping or adjacent windows of the same kind are merged into a single
 * region. If nothing is found, one whole-sequence region describes the
 * dominant residue class instead.
 */

#pragma once

#include "protscope/io/sequence.h"
#include <cstddef>
#include <string>
#include <vector>

namespace protscope {
namespace domains {

constexpr std::size_t kScanWindow = 10;
constexpr std::size_t kMinHydrophobicInWindow = 7;
constexpr std::size_t kMinChargedInWindow = 5;
constexpr double kMotifScore = 95.0;

struct DomainRegion {
    std::string name;
    std::size_t start = 0;  // 1-based, inclusive
    std::size_t end = 0;    // 1-based, inclusive
    double score = 0.0;     // percent
    std::string description;
};

struct Motif {
    const char* name;
    const char* pattern;
    const char* description;
};

// Motifs searched by scan(), in report order.
const std::vector<Motif>& known_motifs();

/**
 * Scan a sequence for domain regions.
 *
 * Regions are ordered: motif hits (in known_motifs() order), then
 * transmembrane regions, then charged regions, each group by start.
 *
 * Qualifying kScanWindow windows are not reported one by one. Windows of
 * the same kind that overlap or touch merge into a single region spanning
 * all of them, scored with the best window's percentage.
 *
 * @throws EmptySequenceError if seq is empty
 */
std::vector<DomainRegion> scan(const io::Sequence& seq);

}  // namespace domains
}  // namespace protscope
