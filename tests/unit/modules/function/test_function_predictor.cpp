/**
 * Unit tests for the reference table and nearest-reference function prediction.
 */

#include "protscope/modules/function/function_predictor.h"
#include "protscope/modules/function/reference_table.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/sequence.h"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using protscope::function::FunctionPrediction;
using protscope::function::ReferenceEntry;
using protscope::function::ReferenceFunctionTable;
using protscope::function::builtin_reference_table;
using protscope::function::predict;
namespace embedding = protscope::embedding;
namespace errors = protscope::errors;

constexpr double TOLERANCE = 1e-9;

bool close(double a, double b, double tol = TOLERANCE) {
    return std::abs(a - b) < tol;
}

/**
 * Test 1: Candidates are ordered by similarity with 1-based ranks.
 */
bool test_ordering() {
    std::cout << "=== Test 1: Candidate Ordering ===" << std::endl;

    std::vector<ReferenceEntry> entries = {
        {"far", {0.0, 1.0, 0.0}},
        {"near", {1.0, 0.1, 0.0}},
        {"middle", {1.0, 1.0, 0.0}},
    };
    ReferenceFunctionTable table(entries);

    FunctionPrediction prediction = predict(embedding::Embedding{1.0, 0.0, 0.0}, table);

    bool passed = prediction.candidates.size() == 3 && prediction.label() == "near" &&
                  prediction.candidates[1].label == "middle" &&
                  prediction.candidates[2].label == "far" &&
                  prediction.candidates[0].rank == 1 && prediction.candidates[2].rank == 3 &&
                  close(prediction.candidates[2].similarity, 0.0) &&
                  close(prediction.candidates[1].similarity, 1.0 / std::sqrt(2.0));

    for (const auto& c : prediction.candidates) {
        std::cout << c.rank << ". " << c.label << " " << c.similarity << std::endl;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 2: Equal similarities keep table insertion order.
 */
bool test_tie_break() {
    std::cout << "=== Test 2: Tie Break ===" << std::endl;

    std::vector<ReferenceEntry> entries = {
        {"other", {0.0, 1.0}},
        {"second", {2.0, 0.0}},
        {"first", {1.0, 0.0}},
    };
    ReferenceFunctionTable table(entries);

    FunctionPrediction prediction = predict(embedding::Embedding{1.0, 0.0}, table);

    bool passed = prediction.candidates[0].label == "second" &&
                  prediction.candidates[1].label == "first" &&
                  prediction.candidates[2].label == "other" &&
                  prediction.candidates[0].similarity == prediction.candidates[1].similarity;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 3: A query equal to a reference vector predicts it with confidence 1.
 */
bool test_self_similarity() {
    std::cout << "=== Test 3: Self Similarity ===" << std::endl;

    const auto& table = builtin_reference_table();

    bool passed = true;
    for (const auto& entry : table) {
        FunctionPrediction prediction = predict(entry.vector, table);
        if (prediction.label() != entry.label || !close(prediction.confidence(), 1.0)) {
            std::cout << entry.label << " predicted as " << prediction.label() << std::endl;
            passed = false;
        }
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 4: Built-in labels in their fixed order.
 */
bool test_builtin_labels() {
    std::cout << "=== Test 4: Built-in Labels ===" << std::endl;

    const auto& table = builtin_reference_table();
    const std::vector<std::string> expected = {"enzyme", "transport", "signaling",
                                               "DNA/RNA binding", "structural"};

    bool passed = table.labels() == expected &&
                  table.dimension() == embedding::kEmbeddingDim && table.contains("enzyme") &&
                  !table.contains("kinase");

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 5: Realistic sequences get a ranked prediction over every label.
 */
bool test_real_sequence() {
    std::cout << "=== Test 5: Real Sequence ===" << std::endl;

    auto seq = protscope::io::validate(
        "MKTAYIAKQRQISFVKSHFSRQLEERLGLIEVQAPILSRVGDGTQDNLSGAEKAVQVKVKALPDAQ");
    FunctionPrediction prediction = predict(embedding::embed(seq), builtin_reference_table());

    bool passed = prediction.candidates.size() == 5;
    for (size_t i = 0; passed && i < prediction.candidates.size(); i++) {
        const auto& c = prediction.candidates[i];
        passed = c.similarity >= 0.0 && c.similarity <= 1.0 && c.rank == static_cast<int>(i + 1);
        if (i > 0) {
            passed = passed && prediction.candidates[i - 1].similarity >= c.similarity;
        }
    }

    std::cout << "Predicted: " << prediction.label() << " (" << prediction.confidence() << ")"
              << std::endl;
    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 6: Table construction errors.
 */
bool test_table_errors() {
    std::cout << "=== Test 6: Table Errors ===" << std::endl;

    int caught = 0;

    try {
        ReferenceFunctionTable empty(std::vector<ReferenceEntry>{});
    } catch (const errors::EmptyReferenceTableError&) {
        caught++;
    }

    try {
        std::vector<ReferenceEntry> entries = {{"a", {1.0, 0.0}}, {"b", {1.0}}};
        ReferenceFunctionTable ragged(entries);
    } catch (const errors::DimensionError&) {
        caught++;
    }

    try {
        std::vector<ReferenceEntry> entries = {{"a", {1.0}}, {"a", {0.5}}};
        ReferenceFunctionTable duplicate(entries);
    } catch (const errors::ValidationError&) {
        caught++;
    }

    try {
        std::vector<ReferenceEntry> entries = {{"", {1.0}}};
        ReferenceFunctionTable unnamed(entries);
    } catch (const errors::ValidationError&) {
        caught++;
    }

    bool passed = caught == 4;
    std::cout << "Caught " << caught << "/4" << std::endl;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 7: Query and table dimensions must agree.
 */
bool test_query_dimension() {
    std::cout << "=== Test 7: Query Dimension ===" << std::endl;

    bool passed = false;
    try {
        predict(embedding::Embedding{1.0, 0.0, 0.0}, builtin_reference_table());
    } catch (const errors::DimensionError& e) {
        std::cout << e.formatted() << std::endl;
        passed = true;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Function Prediction Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 7;

    if (test_ordering()) passed++;
    if (test_tie_break()) passed++;
    if (test_self_similarity()) passed++;
    if (test_builtin_labels()) passed++;
    if (test_real_sequence()) passed++;
    if (test_table_errors()) passed++;
    if (test_query_dimension()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
