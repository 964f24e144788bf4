/**
 * Sequence embedding for function prediction.
 *
 * Layout of the fixed-length vector (kEmbeddingDim = 22):
 *   [0, 20)  residue frequency histogram in io::kAlphabet order, sums to 1
 *   20       length bucket feature, in [0, 1], times kDerivedFeatureWeight
 *   21       hydrophobicity feature, in [0, 1], times kDerivedFeatureWeight
 *
 * Every entry is non-negative, so cosine similarity between two embeddings
 * lies in [0, 1].
 */

#pragma once

#include "protscope/io/amino_acids.h"
#include "protscope/io/sequence.h"
#include <cstddef>
#include <vector>

namespace protscope {
namespace embedding {

using Embedding = std::vector<double>;

constexpr std::size_t kHistogramDim = io::kNumAminoAcids;
constexpr std::size_t kLengthFeature = kHistogramDim;
constexpr std::size_t kHydrophobicityFeature = kHistogramDim + 1;
constexpr std::size_t kEmbeddingDim = kHistogramDim + 2;

// Keeps the two scalar features from outweighing the composition histogram.
constexpr double kDerivedFeatureWeight = 0.25;

/**
 * Map a sequence length to its bucket value in [0, 1].
 *
 * Buckets: <50, <150, <400, <1000, >=1000 -> 0, 0.25, 0.5, 0.75, 1.0
 */
double length_bucket(std::size_t length);

/**
 * Map a mean Kyte-Doolittle score to [0, 1].
 */
double scaled_hydrophobicity(double mean_hydrophobicity);

/**
 * Embed a sequence.
 *
 * @param seq Validated sequence
 * @return Vector of length kEmbeddingDim
 * @throws EmptySequenceError if seq is empty
 */
Embedding embed(const io::Sequence& seq);

/**
 * Embed a sequence whose mean hydrophobicity is already known.
 *
 * Produces exactly the same vector as embed(seq) when mean_hydrophobicity
 * equals hydrophobicity::analyze(seq).mean.
 */
Embedding embed(const io::Sequence& seq, double mean_hydrophobicity);

/**
 * Cosine similarity of two equal-length vectors.
 *
 * Returns 0 when either vector has zero norm.
 *
 * @throws DimensionError if the lengths differ
 */
double cosine_similarity(const Embedding& a, const Embedding& b);

}  // namespace embedding
}  // namespace protscope
