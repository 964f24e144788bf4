#include "fasta_reader.h"
#include "protscope/errors/messages.h"
#include "protscope/errors/validators.h"
#include <cctype>
#include <fstream>

namespace protscope {
namespace io {

namespace {

void strip_trailing_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string header_name(const std::string& line, std::size_t record_number) {
    std::size_t begin = 1;
    while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin]))) {
        begin++;
    }
    std::size_t end = begin;
    while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
        end++;
    }
    if (end == begin) {
        return "record_" + std::to_string(record_number);
    }
    return line.substr(begin, end - begin);
}

}  // namespace

std::vector<FastaRecord> parse_fasta(std::istream& in, const std::string& source) {
    std::vector<FastaRecord> records;
    std::string line;
    std::size_t line_number = 0;
    bool in_record = false;

    auto close_record = [&](std::size_t last_line) {
        if (in_record && is_blank(records.back().raw)) {
            throw errors::messages::fasta_empty_record(source, records.back().name, last_line);
        }
    };

    while (std::getline(in, line)) {
        line_number++;
        strip_trailing_cr(line);

        if (line_number == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line = line.substr(3);
        }
        if (is_blank(line)) {
            continue;
        }

        if (line[0] == '>') {
            close_record(line_number - 1);
            records.push_back({header_name(line, records.size() + 1), ""});
            in_record = true;
            continue;
        }

        if (!in_record) {
            // Sequence text before any header: treat as an unnamed record.
            records.push_back({"record_" + std::to_string(records.size() + 1), ""});
            in_record = true;
        }
        records.back().raw += line;
    }
    close_record(line_number);

    if (records.empty()) {
        throw errors::messages::fasta_no_records(source);
    }
    return records;
}

std::vector<FastaRecord> read_fasta(const std::string& path) {
    validation::validate_file_exists(path, "FASTA file");
    std::ifstream file(path);
    if (!file.is_open()) {
        throw errors::messages::file_not_found(path, "FASTA file");
    }
    return parse_fasta(file, path);
}

bool looks_like_fasta(const std::string& text) {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '>';
    }
    return false;
}

}  // namespace io
}  // namespace protscope
