#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace protscope {
namespace commands {

// Global flags shared across all commands
struct GlobalFlags {
    bool quiet = false;            // Suppress informational output
    std::string reference_path;    // Reference table TSV, empty = built-in table
    int window = 9;                // Hydrophobicity smoothing window
};

// Helper functions for output
inline void print_info(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << message << std::endl;
    }
}

inline void print_success(const std::string& message, bool quiet) {
    if (!quiet) {
        std::cout << "[OK] " << message << std::endl;
    }
}

template <typename T>
inline void print_field(const std::string& name, const T& value, bool quiet) {
    if (!quiet) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
}

// Analyze one sequence (raw text or the first record of a FASTA file)
// Usage: protscope analyze <sequence|file.fasta> [--output summary.tsv]
int analyze(const std::string& input, const std::string& output_path, const GlobalFlags& flags);

// Compare an original and a mutated sequence
// Usage: protscope compare <original> <mutated>
int compare(const std::string& original, const std::string& mutated, const GlobalFlags& flags);

// Analyze every record of a FASTA file on a worker pool
// Usage: protscope batch <file.fasta> --output summary.tsv [--threads N]
int batch(const std::string& fasta_path, const std::string& output_path, size_t threads,
          const GlobalFlags& flags);

// List reference function labels, or print the whole table with dump
// Usage: protscope labels [--reference table.tsv] [--dump]
int labels(bool dump, const GlobalFlags& flags);

}  // namespace commands
}  // namespace protscope
