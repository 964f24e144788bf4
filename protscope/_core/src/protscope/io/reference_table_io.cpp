#include "reference_table_io.h"
#include "protscope/errors/messages.h"
#include "protscope/errors/validators.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <unordered_set>
#include <vector>

namespace protscope {
namespace io {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_values(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == ',' || c == '\r') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

}  // namespace

function::ReferenceFunctionTable parse_reference_table(std::istream& in,
                                                       const std::string& source) {
    std::vector<function::ReferenceEntry> entries;
    std::unordered_set<std::string> labels;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        const auto tab = stripped.find('\t');
        if (tab == std::string::npos) {
            throw errors::messages::reference_parse_error(source, line_number,
                                                          "missing TAB after label");
        }

        function::ReferenceEntry entry;
        entry.label = trim(stripped.substr(0, tab));
        if (entry.label.empty()) {
            throw errors::messages::reference_parse_error(source, line_number, "empty label");
        }
        if (!labels.insert(entry.label).second) {
            throw errors::messages::reference_parse_error(
                source, line_number, "duplicate label '" + entry.label + "'");
        }

        for (const std::string& token : split_values(stripped.substr(tab + 1))) {
            char* end = nullptr;
            errno = 0;
            const double value = std::strtod(token.c_str(), &end);
            if (end == token.c_str() || *end != '\0' || errno == ERANGE) {
                throw errors::messages::reference_parse_error(
                    source, line_number, "not a number: '" + token + "'");
            }
            if (value < 0.0) {
                throw errors::messages::reference_parse_error(
                    source, line_number, "negative value " + token + " for '" + entry.label + "'");
            }
            entry.vector.push_back(value);
        }

        if (entry.vector.size() != embedding::kEmbeddingDim) {
            throw errors::messages::reference_dimension_mismatch(
                entry.label, entry.vector.size(), embedding::kEmbeddingDim);
        }
        entries.push_back(std::move(entry));
    }

    return function::ReferenceFunctionTable(std::move(entries), source);
}

function::ReferenceFunctionTable load_reference_table(const std::string& path) {
    validation::validate_file_exists(path, "Reference table");
    std::ifstream file(path);
    if (!file.is_open()) {
        throw errors::messages::file_not_found(path, "Reference table");
    }
    return parse_reference_table(file, path);
}

void write_reference_table(std::ostream& out, const function::ReferenceFunctionTable& table) {
    out << "# label\tA C D E F G H I K L M N P Q R S T V W Y length hydrophobicity\n";
    out << std::setprecision(17);
    for (const auto& entry : table) {
        out << entry.label << '\t';
        for (std::size_t i = 0; i < entry.vector.size(); i++) {
            if (i > 0) out << ' ';
            out << entry.vector[i];
        }
        out << '\n';
    }
}

}  // namespace io
}  // namespace protscope
