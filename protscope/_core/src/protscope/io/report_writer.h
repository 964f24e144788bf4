/**
 * Text and TSV renderings of analysis results.
 *
 * TSV summary columns (one row per sequence):
 *   id length mean_hydrophobicity helix sheet coil function confidence
 *   domain_call hydrophobic polar charged molecular_weight
 */

#pragma once

#include "protscope/common/result_types.h"
#include <ostream>
#include <string>
#include <vector>

namespace protscope {
namespace io {

// Human-readable multi-line report for one sequence.
std::string format_analysis(const AnalysisResult& result, const std::string& name = "");

// Human-readable report for a mutation comparison.
std::string format_delta(const MutationDelta& delta);

void write_summary_header(std::ostream& out);
void write_summary_row(std::ostream& out, const std::string& id, const AnalysisResult& result);

/**
 * Write header plus one row per result to path.
 *
 * ids and results must have the same length.
 *
 * @throws FileWriteError if the file cannot be written
 */
void write_summary_tsv(const std::string& path, const std::vector<std::string>& ids,
                       const std::vector<AnalysisResult>& results);

}  // namespace io
}  // namespace protscope
