#include "protscope/cli/cli.h"
#include "commands/commands.h"
#include <iostream>

using namespace protscope::cli;

int main(int argc, char** argv) {
    App app("protscope", "Protein sequence analysis: hydrophobicity, structure, function");
    app.require_subcommand();

    // ========== Global Flags ==========
    protscope::commands::GlobalFlags flags;

    app.add_flag("--quiet", flags.quiet, "Suppress informational output (only show results)");
    app.add_option("--reference", flags.reference_path,
                   "Reference function table (TSV, default: built-in table)")
        ->check(ExistingFile());
    app.add_option("--window", flags.window, "Hydrophobicity smoothing window (default: 9)")
        ->check(OddNumber());

    // ========== Analyze Subcommand ==========
    App* analyze_cmd = app.add_subcommand("analyze", "Analyze one protein sequence");

    std::string analyze_input, analyze_output;
    analyze_cmd->add_positional("sequence", analyze_input, "Sequence text or FASTA file");
    analyze_cmd->add_option("-o,--output", analyze_output, "Write a TSV summary row");

    // ========== Compare Subcommand ==========
    App* compare_cmd = app.add_subcommand("compare", "Compare an original and a mutated sequence");

    std::string compare_original, compare_mutated;
    compare_cmd->add_positional("original", compare_original, "Original sequence or FASTA file");
    compare_cmd->add_positional("mutated", compare_mutated, "Mutated sequence or FASTA file");

    // ========== Batch Subcommand ==========
    App* batch_cmd = app.add_subcommand("batch", "Analyze every record of a FASTA file");

    std::string batch_input, batch_output;
    size_t batch_threads = 0;
    batch_cmd->add_positional("input", batch_input, "Input FASTA file")->check(ExistingFile());
    batch_cmd->add_option("-o,--output", batch_output, "Output summary (.tsv)")->required(true);
    batch_cmd->add_option("--threads", batch_threads, "Worker threads (default: 0 = all cores)")
        ->check(Range(0, 1024));

    // ========== Labels Subcommand ==========
    App* labels_cmd = app.add_subcommand("labels", "List reference function labels");

    bool labels_dump = false;
    labels_cmd->add_flag("--dump", labels_dump, "Print the full table in reference TSV format");

    PROTSCOPE_PARSE(app, argc, argv);

    if (app.get_active_subcommand() == analyze_cmd) {
        return protscope::commands::analyze(analyze_input, analyze_output, flags);
    } else if (app.get_active_subcommand() == compare_cmd) {
        return protscope::commands::compare(compare_original, compare_mutated, flags);
    } else if (app.get_active_subcommand() == batch_cmd) {
        return protscope::commands::batch(batch_input, batch_output, batch_threads, flags);
    } else if (app.get_active_subcommand() == labels_cmd) {
        return protscope::commands::labels(labels_dump, flags);
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
