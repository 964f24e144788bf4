/**
 * PyBind11 entry point for protscope.
 *
 * Exposes validate, analyze_full, analyze_batch, compare, known_labels and
 * reference table loading. Sequences cross the boundary as plain strings
 * and are validated on the C++ side; results are read-only classes.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include "protscope/common/result_types.h"
#include "protscope/engine/analysis_engine.h"
#include "protscope/errors/error_categories.h"
#include "protscope/errors/protscope_error.h"
#include "protscope/io/reference_table_io.h"
#include "protscope/modules/function/reference_table.h"

namespace py = pybind11;

using protscope::AnalysisResult;
using protscope::MutationDelta;
using protscope::engine::AnalysisEngine;
using protscope::engine::EngineConfig;
using protscope::function::ReferenceFunctionTable;

namespace {

const ReferenceFunctionTable& TableOrBuiltin(const ReferenceFunctionTable* reference) {
    return reference ? *reference : protscope::function::builtin_reference_table();
}

EngineConfig MakeConfig(int window, size_t threads) {
    EngineConfig config;
    config.analysis.smoothing_window = window;
    config.num_threads = threads;
    return config;
}

std::string Validate(const std::string& raw) {
    return protscope::io::validate(raw).residues();
}

AnalysisResult AnalyzeFull(const std::string& raw, const ReferenceFunctionTable* reference,
                           int window) {
    AnalysisEngine engine(TableOrBuiltin(reference), MakeConfig(window, 1));
    auto seq = engine.validate(raw);
    py::gil_scoped_release release;
    return engine.analyze_full(seq);
}

std::vector<AnalysisResult> AnalyzeBatch(const std::vector<std::string>& raws,
                                         const ReferenceFunctionTable* reference, int window,
                                         size_t threads) {
    AnalysisEngine engine(TableOrBuiltin(reference), MakeConfig(window, threads));

    std::vector<protscope::io::Sequence> sequences;
    sequences.reserve(raws.size());
    for (const auto& raw : raws) {
        sequences.push_back(engine.validate(raw));
    }

    py::gil_scoped_release release;  // Release GIL before spawning worker threads
    return engine.analyze_batch(sequences);
}

MutationDelta Compare(const std::string& original, const std::string& mutated,
                      const ReferenceFunctionTable* reference, int window) {
    AnalysisEngine engine(TableOrBuiltin(reference), MakeConfig(window, 1));
    auto original_seq = engine.validate(original);
    auto mutated_seq = engine.validate(mutated);
    py::gil_scoped_release release;
    return engine.compare(original_seq, mutated_seq);
}

std::vector<std::string> KnownLabels(const ReferenceFunctionTable* reference) {
    return TableOrBuiltin(reference).labels();
}

}  // namespace

PYBIND11_MODULE(_protscope, m) {
    m.doc() = "protscope - protein sequence analysis";
    m.attr("__version__") = "0.1.0";

    // ----------------------- Custom Exception Types -----------------------
    namespace errors = protscope::errors;

    static py::exception<errors::ProtscopeError> exc_protscope(m, "ProtscopeError");
    static py::exception<errors::InvalidSequenceError> exc_invalid_sequence(m, "InvalidSequenceError", PyExc_ValueError);
    static py::exception<errors::EmptySequenceError> exc_empty_sequence(m, "EmptySequenceError", PyExc_ValueError);
    static py::exception<errors::EmptyReferenceTableError> exc_empty_reference(m, "EmptyReferenceTableError", PyExc_ValueError);
    static py::exception<errors::FileNotFoundError> exc_file_not_found(m, "FileNotFoundError", PyExc_FileNotFoundError);
    static py::exception<errors::FileWriteError> exc_file_write(m, "FileWriteError", PyExc_OSError);
    static py::exception<errors::ValidationError> exc_validation(m, "ValidationError", PyExc_ValueError);
    static py::exception<errors::FormatError> exc_format(m, "FormatError", PyExc_ValueError);
    static py::exception<errors::DimensionError> exc_dimension(m, "DimensionError", PyExc_ValueError);

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const errors::InvalidSequenceError& e) {
            py::set_error(exc_invalid_sequence, e.formatted().c_str());
        } catch (const errors::EmptySequenceError& e) {
            py::set_error(exc_empty_sequence, e.formatted().c_str());
        } catch (const errors::EmptyReferenceTableError& e) {
            py::set_error(exc_empty_reference, e.formatted().c_str());
        } catch (const errors::FileNotFoundError& e) {
            py::set_error(exc_file_not_found, e.formatted().c_str());
        } catch (const errors::FileWriteError& e) {
            py::set_error(exc_file_write, e.formatted().c_str());
        } catch (const errors::ValidationError& e) {
            py::set_error(exc_validation, e.formatted().c_str());
        } catch (const errors::FormatError& e) {
            py::set_error(exc_format, e.formatted().c_str());
        } catch (const errors::DimensionError& e) {
            py::set_error(exc_dimension, e.formatted().c_str());
        } catch (const errors::ProtscopeError& e) {
            py::set_error(exc_protscope, e.formatted().c_str());
        }
    });

    py::enum_<errors::ErrorCategory>(m, "ErrorCategory")
        .value("Sequence", errors::ErrorCategory::Sequence)
        .value("Configuration", errors::ErrorCategory::Configuration)
        .value("FileIO", errors::ErrorCategory::FileIO)
        .value("Validation", errors::ErrorCategory::Validation)
        .value("Format", errors::ErrorCategory::Format)
        .export_values();

    // ----------------------- Reference Table -----------------------
    py::class_<ReferenceFunctionTable>(m, "ReferenceTable")
        .def_property_readonly("labels", &ReferenceFunctionTable::labels)
        .def_property_readonly("dimension", &ReferenceFunctionTable::dimension)
        .def("__len__", &ReferenceFunctionTable::size)
        .def("__contains__", &ReferenceFunctionTable::contains)
        .def("vector", [](const ReferenceFunctionTable& self, const std::string& label) {
            for (const auto& entry : self) {
                if (entry.label == label) return entry.vector;
            }
            throw py::key_error(label);
        }, py::arg("label"));

    m.def("load_reference_table", &protscope::io::load_reference_table, py::arg("path"),
          "Load a reference function table from a TSV file");
    m.def("builtin_reference_table", &protscope::function::builtin_reference_table,
          py::return_value_policy::reference, "The built-in reference function table");

    // ----------------------- Result Types -----------------------
    py::class_<protscope::structure::StructureComposition>(m, "StructureComposition")
        .def_readonly("helix", &protscope::structure::StructureComposition::helix)
        .def_readonly("sheet", &protscope::structure::StructureComposition::sheet)
        .def_readonly("coil", &protscope::structure::StructureComposition::coil);

    py::class_<protscope::function::FunctionCandidate>(m, "FunctionCandidate")
        .def_readonly("label", &protscope::function::FunctionCandidate::label)
        .def_readonly("similarity", &protscope::function::FunctionCandidate::similarity)
        .def_readonly("rank", &protscope::function::FunctionCandidate::rank)
        .def("__repr__", [](const protscope::function::FunctionCandidate& self) {
            return "<FunctionCandidate " + self.label + " " + std::to_string(self.similarity) + ">";
        });

    py::class_<protscope::composition::CompositionSummary>(m, "CompositionSummary")
        .def_readonly("length", &protscope::composition::CompositionSummary::length)
        .def_readonly("hydrophobic_fraction", &protscope::composition::CompositionSummary::hydrophobic_fraction)
        .def_readonly("polar_fraction", &protscope::composition::CompositionSummary::polar_fraction)
        .def_readonly("charged_fraction", &protscope::composition::CompositionSummary::charged_fraction)
        .def_readonly("molecular_weight", &protscope::composition::CompositionSummary::molecular_weight);

    py::class_<protscope::composition::DomainCall>(m, "DomainCall")
        .def_readonly("domain", &protscope::composition::DomainCall::domain)
        .def_readonly("score", &protscope::composition::DomainCall::score)
        .def_readonly("confident", &protscope::composition::DomainCall::confident);

    py::class_<protscope::domains::DomainRegion>(m, "DomainRegion")
        .def_readonly("name", &protscope::domains::DomainRegion::name)
        .def_readonly("start", &protscope::domains::DomainRegion::start)
        .def_readonly("end", &protscope::domains::DomainRegion::end)
        .def_readonly("score", &protscope::domains::DomainRegion::score)
        .def_readonly("description", &protscope::domains::DomainRegion::description);

    py::class_<AnalysisResult>(m, "AnalysisResult")
        .def_property_readonly("sequence", [](const AnalysisResult& self) {
            return self.sequence.residues();
        })
        .def_property_readonly("length", [](const AnalysisResult& self) {
            return self.sequence.size();
        })
        .def_property_readonly("hydrophobicity", [](const AnalysisResult& self) {
            return self.hydrophobicity.per_residue;
        }, "Per-residue Kyte-Doolittle values")
        .def_property_readonly("mean_hydrophobicity", [](const AnalysisResult& self) {
            return self.hydrophobicity.mean;
        })
        .def_readonly("smoothed_hydrophobicity", &AnalysisResult::smoothed_hydrophobicity)
        .def_readonly("structure", &AnalysisResult::structure)
        .def_property_readonly("states", [](const AnalysisResult& self) {
            return self.states.states;
        }, "Per-residue H/E/C assignment")
        .def_property_readonly("state_confidence", [](const AnalysisResult& self) {
            return self.states.confidence;
        })
        .def_readonly("embedding", &AnalysisResult::embedding)
        .def_property_readonly("function", [](const AnalysisResult& self) {
            return self.function.label();
        }, "Top predicted function label")
        .def_property_readonly("confidence", [](const AnalysisResult& self) {
            return self.function.confidence();
        })
        .def_property_readonly("candidates", [](const AnalysisResult& self) {
            return self.function.candidates;
        })
        .def_readonly("composition", &AnalysisResult::composition)
        .def_readonly("domain_call", &AnalysisResult::domain_call)
        .def_readonly("domains", &AnalysisResult::domains);

    py::class_<MutationDelta>(m, "MutationDelta")
        .def_readonly("original", &MutationDelta::original)
        .def_readonly("mutated", &MutationDelta::mutated)
        .def_readonly("hydrophobicity_delta", &MutationDelta::hydrophobicity_delta)
        .def_property_readonly("structure_delta", [](const MutationDelta& self) {
            py::dict d;
            d["helix"] = self.structure_delta.helix;
            d["sheet"] = self.structure_delta.sheet;
            d["coil"] = self.structure_delta.coil;
            return d;
        })
        .def_readonly("function_changed", &MutationDelta::function_changed)
        .def_readonly("original_label", &MutationDelta::original_label)
        .def_readonly("mutated_label", &MutationDelta::mutated_label)
        .def_readonly("original_confidence", &MutationDelta::original_confidence)
        .def_readonly("mutated_confidence", &MutationDelta::mutated_confidence)
        .def_readonly("length_delta", &MutationDelta::length_delta)
        .def_readonly("hydrophobic_fraction_delta", &MutationDelta::hydrophobic_fraction_delta)
        .def_readonly("polar_fraction_delta", &MutationDelta::polar_fraction_delta)
        .def_readonly("charged_fraction_delta", &MutationDelta::charged_fraction_delta)
        .def_readonly("molecular_weight_delta", &MutationDelta::molecular_weight_delta);

    // ----------------------- Analysis Functions -----------------------
    m.def("validate", &Validate, py::arg("sequence"),
          "Strip whitespace, upper-case and check residues; returns the canonical sequence");

    m.def("analyze_full", &AnalyzeFull,
          py::arg("sequence"),
          py::arg("reference") = nullptr,
          py::arg("window") = 9,
          "Analyze one sequence");

    m.def("analyze_batch", &AnalyzeBatch,
          py::arg("sequences"),
          py::arg("reference") = nullptr,
          py::arg("window") = 9,
          py::arg("threads") = 0,
          "Analyze many sequences in parallel; results are in input order");

    m.def("compare", &Compare,
          py::arg("original"),
          py::arg("mutated"),
          py::arg("reference") = nullptr,
          py::arg("window") = 9,
          "Compare an original and a mutated sequence (deltas are mutated - original)");

    m.def("known_labels", &KnownLabels, py::arg("reference") = nullptr,
          "Reference function labels in table order");
}
