/**
 * Unit tests for FASTA parsing.
 */

#include "protscope/io/fasta_reader.h"
#include "protscope/errors/protscope_error.h"
#include <iostream>
#include <sstream>
#include <string>

using protscope::errors::FileNotFoundError;
using protscope::errors::FormatError;
using protscope::io::looks_like_fasta;
using protscope::io::parse_fasta;
using protscope::io::read_fasta;

/**
 * Test 1: Multi-record, multi-line input.
 */
bool test_records() {
    std::cout << "=== Test 1: Records ===" << std::endl;

    std::istringstream in(">sp|P1|first protein one\nMKTAY\nIAKQR\n\n>second\nGGGG\n");
    auto records = parse_fasta(in, "test.fa");

    bool passed = records.size() == 2 && records[0].name == "sp|P1|first" &&
                  records[0].raw == "MKTAYIAKQR" && records[1].name == "second" &&
                  records[1].raw == "GGGG";

    for (const auto& r : records) {
        std::cout << r.name << ": " << r.raw << std::endl;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 2: BOM, CRLF line endings and unnamed records.
 */
bool test_line_endings() {
    std::cout << "=== Test 2: BOM and CRLF ===" << std::endl;

    std::istringstream in("\xEF\xBB\xBF>a\r\nMK\r\nTA\r\n>\r\nWW\r\n");
    auto records = parse_fasta(in, "crlf.fa");

    bool passed = records.size() == 2 && records[0].name == "a" && records[0].raw == "MKTA" &&
                  records[1].name == "record_2" && records[1].raw == "WW";

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 3: Sequence text with no header is one unnamed record.
 */
bool test_headerless() {
    std::cout << "=== Test 3: Headerless ===" << std::endl;

    std::istringstream in("MKTAY\nIAKQR\n");
    auto records = parse_fasta(in, "plain.txt");

    bool passed = records.size() == 1 && records[0].name == "record_1" &&
                  records[0].raw == "MKTAYIAKQR";

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 4: Empty records and empty files are format errors.
 */
bool test_format_errors() {
    std::cout << "=== Test 4: Format Errors ===" << std::endl;

    int caught = 0;

    try {
        std::istringstream in(">a\n>b\nMK\n");
        parse_fasta(in, "empty_record.fa");
    } catch (const FormatError& e) {
        std::cout << e.formatted() << std::endl;
        if (e.message().find("'a'") != std::string::npos) caught++;
    }

    try {
        std::istringstream in(">a\nMK\n>last\n\n");
        parse_fasta(in, "trailing.fa");
    } catch (const FormatError&) {
        caught++;
    }

    try {
        std::istringstream in("\n  \n");
        parse_fasta(in, "blank.fa");
    } catch (const FormatError&) {
        caught++;
    }

    bool passed = caught == 3;
    std::cout << "Caught " << caught << "/3" << std::endl;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 5: Residues are not validated while reading.
 */
bool test_raw_passthrough() {
    std::cout << "=== Test 5: Raw Passthrough ===" << std::endl;

    std::istringstream in(">x\nmkt xz\n");
    auto records = parse_fasta(in, "raw.fa");

    bool passed = records.size() == 1 && records[0].raw == "mkt xz";

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 6: FASTA detection and missing files.
 */
bool test_detection_and_missing_file() {
    std::cout << "=== Test 6: Detection and Missing File ===" << std::endl;

    bool passed = looks_like_fasta("  \n>seq\nMK") && !looks_like_fasta("MKTAY") &&
                  !looks_like_fasta("");

    try {
        read_fasta("/nonexistent/protscope/input.fa");
        passed = false;
    } catch (const FileNotFoundError&) {
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  FASTA Reader Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 6;

    if (test_records()) passed++;
    if (test_line_endings()) passed++;
    if (test_headerless()) passed++;
    if (test_format_errors()) passed++;
    if (test_raw_passthrough()) passed++;
    if (test_detection_and_missing_file()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
