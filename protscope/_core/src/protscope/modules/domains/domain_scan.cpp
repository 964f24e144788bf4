#include "domain_scan.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/modules/composition/composition.h"
#include "protscope/tables/residue_scales.h"
#include <algorithm>
#include <string_view>

namespace protscope {
namespace domains {

const std::vector<Motif>& known_motifs() {
    static const std::vector<Motif> kMotifs = {
        {"Insulin/IGF/Relaxin", "FVNQHLCGSHLVEAL", "Hormone involved in glucose regulation"},
        {"Transmembrane motif", "LLLLLLFFFF", "Membrane-spanning region"},
        {"DNA-binding motif", "KKRRH", "DNA-binding motif"},
    };
    return kMotifs;
}

namespace {

/**
 * Slide a window over seq and merge qualifying windows into regions.
 *
 * Counts are maintained incrementally; a window qualifies when it holds at
 * least min_hits residues of the class. A window that overlaps or touches
 * the open region extends it.
 */
void scan_windows(const io::Sequence& seq, std::string_view members, std::size_t min_hits,
                  const char* name, const char* description,
                  std::vector<DomainRegion>& out) {
    if (seq.size() < kScanWindow) {
        return;
    }

    std::size_t hits = 0;
    for (std::size_t i = 0; i < kScanWindow; i++) {
        if (io::in_class(seq[i], members)) hits++;
    }

    bool open = false;
    DomainRegion current;
    const std::size_t last_start = seq.size() - kScanWindow;

    for (std::size_t start = 0; start <= last_start; start++) {
        if (start > 0) {
            if (io::in_class(seq[start - 1], members)) hits--;
            if (io::in_class(seq[start + kScanWindow - 1], members)) hits++;
        }

        if (hits < min_hits) {
            continue;
        }

        const std::size_t first = start + 1;
        const std::size_t last = start + kScanWindow;
        const double score = 100.0 * static_cast<double>(hits) / static_cast<double>(kScanWindow);

        if (open && first <= current.end + 1) {
            current.end = last;
            current.score = std::max(current.score, score);
            continue;
        }
        if (open) {
            out.push_back(current);
        }
        current = DomainRegion{name, first, last, score, description};
        open = true;
    }

    if (open) {
        out.push_back(current);
    }
}

}  // namespace

std::vector<DomainRegion> scan(const io::Sequence& seq) {
    if (seq.empty()) {
        throw errors::EmptySequenceError("Domain scan");
    }

    std::vector<DomainRegion> regions;

    for (const auto& motif : known_motifs()) {
        const std::size_t pos = seq.residues().find(motif.pattern);
        if (pos != std::string::npos) {
            const std::size_t len = std::string_view(motif.pattern).size();
            regions.push_back({motif.name, pos + 1, pos + len, kMotifScore, motif.description});
        }
    }

    scan_windows(seq, tables::kHydrophobicResidues, kMinHydrophobicInWindow,
                 "Transmembrane domain", "Potential membrane-spanning region", regions);
    scan_windows(seq, tables::kChargedResidues, kMinChargedInWindow,
                 "Charged domain", "Potential binding or interaction site", regions);

    if (!regions.empty()) {
        return regions;
    }

    const composition::CompositionSummary summary = composition::summarize(seq);
    if (summary.hydrophobic_fraction > 0.4) {
        regions.push_back({"Hydrophobic region", 1, seq.size(),
                           summary.hydrophobic_fraction * 100.0,
                           "Region rich in hydrophobic amino acids"});
    } else if (summary.charged_fraction > 0.3) {
        regions.push_back({"Charged region", 1, seq.size(), summary.charged_fraction * 100.0,
                           "Region rich in charged amino acids"});
    } else {
        regions.push_back({"Mixed region", 1, seq.size(), 50.0,
                           "Region with mixed amino acid properties"});
    }
    return regions;
}

}  // namespace domains
}  // namespace protscope
