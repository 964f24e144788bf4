/**
 * Unit tests for the fixed-length function embedding.
 */

#include "protscope/modules/embedding/embedder.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/sequence.h"
#include <cmath>
#include <iostream>
#include <string>

using protscope::io::validate;
namespace embedding = protscope::embedding;

constexpr double TOLERANCE = 1e-9;

bool close(double a, double b, double tol = TOLERANCE) {
    return std::abs(a - b) < tol;
}

/**
 * Test 1: Fixed dimension and a histogram that sums to one.
 */
bool test_histogram() {
    std::cout << "=== Test 1: Histogram ===" << std::endl;

    auto vec = embedding::embed(validate("MKTAYIAKQRQISFVKSHFSRQLEERLGLIEVQ"));

    double histogram_sum = 0.0;
    for (size_t k = 0; k < embedding::kHistogramDim; k++) {
        histogram_sum += vec[k];
    }

    std::cout << "Dimension: " << vec.size() << ", histogram sum: " << histogram_sum
              << std::endl;
    bool passed = vec.size() == embedding::kEmbeddingDim && close(histogram_sum, 1.0);

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 2: Poly-alanine has a one-hot histogram and known derived features.
 */
bool test_known_vector() {
    std::cout << "=== Test 2: Known Vector ===" << std::endl;

    auto vec = embedding::embed(validate("AAAA"));

    bool passed = close(vec[0], 1.0);
    for (size_t k = 1; k < embedding::kHistogramDim; k++) {
        passed = passed && vec[k] == 0.0;
    }

    // Length 4 is in the shortest bucket; mean 1.8 scales to 6.3 / 9
    passed = passed && close(vec[embedding::kLengthFeature], 0.0) &&
             close(vec[embedding::kHydrophobicityFeature], 0.25 * 6.3 / 9.0);

    std::cout << "Hydrophobicity feature: " << vec[embedding::kHydrophobicityFeature]
              << std::endl;
    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 3: Length buckets change at 50, 150, 400 and 1000 residues.
 */
bool test_length_buckets() {
    std::cout << "=== Test 3: Length Buckets ===" << std::endl;

    bool passed = embedding::length_bucket(1) == 0.0 && embedding::length_bucket(49) == 0.0 &&
                  embedding::length_bucket(50) == 0.25 && embedding::length_bucket(149) == 0.25 &&
                  embedding::length_bucket(150) == 0.5 && embedding::length_bucket(399) == 0.5 &&
                  embedding::length_bucket(400) == 0.75 && embedding::length_bucket(999) == 0.75 &&
                  embedding::length_bucket(1000) == 1.0;

    auto vec = embedding::embed(validate(std::string(200, 'G')));
    passed = passed && close(vec[embedding::kLengthFeature], 0.25 * 0.5);

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 4: Hydrophobicity feature is clamped to [0, 1] before weighting.
 */
bool test_scaled_hydrophobicity() {
    std::cout << "=== Test 4: Scaled Hydrophobicity ===" << std::endl;

    bool passed = close(embedding::scaled_hydrophobicity(-4.5), 0.0) &&
                  close(embedding::scaled_hydrophobicity(4.5), 1.0) &&
                  close(embedding::scaled_hydrophobicity(0.0), 0.5) &&
                  embedding::scaled_hydrophobicity(-10.0) == 0.0 &&
                  embedding::scaled_hydrophobicity(10.0) == 1.0;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 5: Cosine similarity properties.
 */
bool test_cosine() {
    std::cout << "=== Test 5: Cosine Similarity ===" << std::endl;

    auto a = embedding::embed(validate("MKTAYIAKQRQISFVKSHFSRQ"));
    auto b = embedding::embed(validate("GGGGPPPPGGGG"));
    const embedding::Embedding zero(embedding::kEmbeddingDim, 0.0);

    const double self = embedding::cosine_similarity(a, a);
    const double ab = embedding::cosine_similarity(a, b);
    const double ba = embedding::cosine_similarity(b, a);

    std::cout << "self: " << self << ", a.b: " << ab << std::endl;
    bool passed = close(self, 1.0) && close(ab, ba) && ab < 1.0 && ab >= 0.0 &&
                  embedding::cosine_similarity(a, zero) == 0.0;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 6: Mismatched lengths raise DimensionError.
 */
bool test_dimension_mismatch() {
    std::cout << "=== Test 6: Dimension Mismatch ===" << std::endl;

    bool passed = false;
    try {
        embedding::cosine_similarity({1.0, 0.0}, {1.0, 0.0, 0.0});
    } catch (const protscope::errors::DimensionError& e) {
        std::cout << e.formatted() << std::endl;
        passed = true;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 7: Passing the mean explicitly matches computing it.
 */
bool test_shared_mean() {
    std::cout << "=== Test 7: Shared Mean ===" << std::endl;

    auto seq = validate("IIIIRRRRAAGG");
    // (4 * 4.5 - 4 * 4.5 + 2 * 1.8 - 2 * 0.4) / 12
    const double mean = (2 * 1.8 - 2 * 0.4) / 12.0;

    auto computed = embedding::embed(seq);
    auto given = embedding::embed(seq, mean);

    bool passed = computed.size() == given.size();
    for (size_t k = 0; passed && k < computed.size(); k++) {
        passed = close(computed[k], given[k]);
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Function Embedding Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 7;

    if (test_histogram()) passed++;
    if (test_known_vector()) passed++;
    if (test_length_buckets()) passed++;
    if (test_scaled_hydrophobicity()) passed++;
    if (test_cosine()) passed++;
    if (test_dimension_mismatch()) passed++;
    if (test_shared_mean()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
