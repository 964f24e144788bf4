/**
 * Unit tests for command-line parsing.
 */

#include "protscope/cli/cli.h"
#include <iostream>
#include <string>
#include <vector>

using namespace protscope::cli;

// Mirrors the protscope command layout
struct Fixture {
    App app{"protscope", "test"};
    bool quiet = false;
    int window = 9;
    std::string reference;
    App* analyze = nullptr;
    App* batch = nullptr;
    std::string input;
    std::string output;
    size_t threads = 0;

    Fixture() {
        app.require_subcommand();
        app.add_flag("--quiet", quiet, "quiet");
        app.add_option("--window", window, "window")->check(OddNumber());
        app.add_option("--reference", reference, "reference");

        analyze = app.add_subcommand("analyze", "analyze");
        analyze->add_positional("sequence", input, "sequence");
        analyze->add_option("-o,--output", output, "output");

        batch = app.add_subcommand("batch", "batch");
        batch->add_positional("input", input, "input");
        batch->add_option("-o,--output", output, "output")->required(true);
        batch->add_option("--threads", threads, "threads")->check(Range(0, 64));
    }
};

/**
 * Test 1: Subcommand with positional, flag and options in any position.
 */
bool test_basic_parse() {
    std::cout << "=== Test 1: Basic Parse ===" << std::endl;

    Fixture f;
    f.app.parse(std::vector<std::string>{"--quiet", "analyze", "MKTAY", "--window", "7",
                                         "-o", "out.tsv"});

    bool passed = f.app.get_active_subcommand() == f.analyze && f.quiet && f.window == 7 &&
                  f.input == "MKTAY" && f.output == "out.tsv";

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 2: --name=value form and a flag that does not consume the next argument.
 */
bool test_inline_value() {
    std::cout << "=== Test 2: Inline Value ===" << std::endl;

    Fixture f;
    f.app.parse(std::vector<std::string>{"batch", "--quiet", "in.fa", "--output=res.tsv",
                                         "--threads=4"});

    bool passed = f.app.get_active_subcommand() == f.batch && f.quiet && f.input == "in.fa" &&
                  f.output == "res.tsv" && f.threads == 4;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 3: Parse failures map to the right error types.
 */
bool test_errors() {
    std::cout << "=== Test 3: Errors ===" << std::endl;

    int caught = 0;

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{"analyze", "MKT", "--window", "4"});
    } catch (const ValidationError& e) {
        std::cout << e.what() << std::endl;
        caught++;
    }

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{"analyze", "MKT", "--bogus"});
    } catch (const ParseError&) {
        caught++;
    }

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{"batch", "in.fa"});
    } catch (const MissingArgument& e) {
        std::cout << e.what() << std::endl;
        caught++;
    }

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{"analyze"});
    } catch (const MissingArgument&) {
        caught++;
    }

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{});
    } catch (const ParseError&) {
        caught++;
    }

    try {
        Fixture f;
        f.app.parse(std::vector<std::string>{"analyze", "A", "B"});
    } catch (const ParseError&) {
        caught++;
    }

    bool passed = caught == 6;
    std::cout << "Caught " << caught << "/6" << std::endl;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 4: --help exits 0 and renders the subcommand help.
 */
bool test_help() {
    std::cout << "=== Test 4: Help ===" << std::endl;

    Fixture f;
    bool passed = false;
    try {
        f.app.parse(std::vector<std::string>{"batch", "--help"});
    } catch (const CallForHelp& e) {
        std::string text = f.app.help();
        std::cout << text << std::endl;
        passed = e.get_exit_code() == 0 && text.find("protscope batch") != std::string::npos &&
                 text.find("--threads") != std::string::npos &&
                 text.find("[REQUIRED]") != std::string::npos;
    }

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 5: Validators on their own.
 */
bool test_validators() {
    std::cout << "=== Test 5: Validators ===" << std::endl;

    Validator odd = OddNumber();
    Validator range = Range(0, 10);

    bool passed = odd("9").empty() && !odd("8").empty() && !odd("0").empty() &&
                  !odd("x").empty() && !odd("3.5").empty() && range("10").empty() &&
                  !range("11").empty() && !range("").empty() &&
                  !ExistingFile()("/nonexistent/protscope/file").empty();

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

/**
 * Test 6: Numeric validators reject huge and non-finite values.
 */
bool test_extreme_numbers() {
    std::cout << "=== Test 6: Extreme Numbers ===" << std::endl;

    Validator odd = OddNumber();
    Validator range = Range(0, 64);

    bool passed = odd("2147483647").empty() && !range("nan").empty() && !range("inf").empty();
    for (const char* bad : {"1e30", "-1e30", "2147483649", "nan", "inf", "-inf"}) {
        if (odd(bad).empty()) {
            std::cout << "Accepted window " << bad << std::endl;
            passed = false;
        }
    }

    Fixture f;
    try {
        f.app.parse(std::vector<std::string>{"analyze", "MKT", "--window", "1e30"});
        passed = false;
    } catch (const ValidationError& e) {
        std::cout << e.what() << std::endl;
    }
    passed = passed && f.window == 9;

    std::cout << (passed ? "✓ PASS" : "✗ FAIL") << std::endl << std::endl;
    return passed;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  CLI Parsing Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 6;

    if (test_basic_parse()) passed++;
    if (test_inline_value()) passed++;
    if (test_errors()) passed++;
    if (test_help()) passed++;
    if (test_validators()) passed++;
    if (test_extreme_numbers()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
