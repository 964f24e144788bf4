/**
 * Unit tests for the Kyte-Doolittle hydrophobicity profile.
 */

#include "protscope/modules/hydrophobicity/hydrophobicity.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/sequence.h"
#include <cmath>
#include <iostream>
#include <vector>

using protscope::io::validate;
namespace hydro = protscope::hydrophobicity;

constexpr double TOLERANCE = 1e-9;

bool close(double a, double b, double tol = TOLERANCE) {
    return std::abs(a - b) < tol;
}

/**
 * Test 1: One value per residue, taken from the scale.
 */
bool test_per_residue_values() {
    std::cout << "=== Test 1: Per-Residue Values ===" << std::endl;

    auto profile = hydro::analyze(validate("IRAG"));
    const std::vector<double> expected = {4.5, -4.5, 1.8, -0.4};

    bool passed = profile.per_residue.size() == expected.size();
    for (size_t i = 0; passed && i < expected.size(); i++) {
        if (!close(profile.per_residue[i], expected[i])) {
            std::cout << "Mismatch at " << i << ": " << profile.per_residue[i] << " vs "
                      << expected[i] << std::endl;
            passed = false;
        }
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 2: Mean is the arithmetic mean of the profile.
 */
bool test_mean() {
    std::cout << "=== Test 2: Mean ===" << std::endl;

    auto balanced = hydro::analyze(validate("IR"));
    auto alanine = hydro::analyze(validate("AAAA"));
    auto mixed = hydro::analyze(validate("IRAG"));

    std::cout << "IR: " << balanced.mean << ", AAAA: " << alanine.mean
              << ", IRAG: " << mixed.mean << std::endl;

    bool passed = close(balanced.mean, 0.0) && close(alanine.mean, 1.8) &&
                  close(mixed.mean, (4.5 - 4.5 + 1.8 - 0.4) / 4.0);

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 3: Profile length equals sequence length for a realistic protein.
 */
bool test_profile_length() {
    std::cout << "=== Test 3: Profile Length ===" << std::endl;

    auto seq = validate("MKTAYIAKQRQISFVKSHFSRQLEERLGLIEVQAPILSRVGDGTQDNLSGAEKAVQVKVKALPDAQ");
    auto profile = hydro::analyze(seq);

    bool passed = profile.per_residue.size() == seq.size();
    std::cout << "Length: " << seq.size() << ", profile: " << profile.per_residue.size()
              << std::endl;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 4: Smoothing with a truncated centred window.
 */
bool test_smooth() {
    std::cout << "=== Test 4: Smoothing ===" << std::endl;

    const std::vector<double> values = {1.0, 2.0, 3.0, 4.0};

    auto identity = hydro::smooth(values, 1);
    auto window3 = hydro::smooth(values, 3);
    auto wide = hydro::smooth(values, 9);

    const std::vector<double> expected3 = {1.5, 2.0, 3.0, 3.5};

    bool passed = identity == values && window3.size() == values.size();
    for (size_t i = 0; passed && i < values.size(); i++) {
        passed = close(window3[i], expected3[i]) && close(wide[i], 2.5);
    }

    std::cout << "Window 3: [" << window3[0] << ", " << window3[1] << ", " << window3[2]
              << ", " << window3[3] << "]" << std::endl;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 5: Even windows are rejected.
 */
bool test_even_window() {
    std::cout << "=== Test 5: Even Window ===" << std::endl;

    bool passed = false;
    try {
        hydro::smooth({1.0, 2.0}, 4);
    } catch (const protscope::errors::ValidationError& e) {
        std::cout << e.formatted() << std::endl;
        passed = true;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 6: An empty sequence is a programming error.
 */
bool test_empty_sequence() {
    std::cout << "=== Test 6: Empty Sequence ===" << std::endl;

    bool passed = false;
    try {
        hydro::analyze(protscope::io::Sequence());
    } catch (const protscope::errors::EmptySequenceError&) {
        passed = true;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Hydrophobicity Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 6;

    if (test_per_residue_values()) passed++;
    if (test_mean()) passed++;
    if (test_profile_length()) passed++;
    if (test_smooth()) passed++;
    if (test_even_window()) passed++;
    if (test_empty_sequence()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
