#include "io/fasta_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace blastbridge {

static void finish_record(std::vector<FastaRecord>& records, FastaRecord& cur,
                          bool& open) {
    if (open) {
        for (auto& c : cur.sequence)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        records.push_back(std::move(cur));
    }
    cur = FastaRecord{};
    open = false;
}

std::vector<FastaRecord> read_fasta_stream(std::istream& in) {
    std::vector<FastaRecord> records;
    std::string line;
    FastaRecord cur;
    bool open = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == ';')
            continue;

        if (line[0] == '>') {
            finish_record(records, cur, open);
            open = true;
            size_t start = 1;
            while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
                start++;
            size_t end = start;
            while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end])))
                end++;
            cur.id = line.substr(start, end - start);
            while (end < line.size() && std::isspace(static_cast<unsigned char>(line[end])))
                end++;
            cur.title = line.substr(end);
        } else if (open) {
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) cur.sequence.push_back(c);
            }
        }
    }

    finish_record(records, cur, open);
    return records;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& records) {
    if (path == "-") {
        records = read_fasta_stream(std::cin);
        return true;
    }

    std::ifstream file(path);
    if (!file.is_open()) return false;
    records = read_fasta_stream(file);
    return true;
}

void write_fasta_record(std::ostream& out, const std::string& header,
                        const std::string& sequence, size_t line_width) {
    out << '>' << header << '\n';
    if (line_width == 0) line_width = sequence.size();
    for (size_t i = 0; i < sequence.size(); i += line_width) {
        size_t len = std::min(line_width, sequence.size() - i);
        out.write(sequence.data() + i, static_cast<std::streamsize>(len));
        out << '\n';
    }
}

} // namespace blastbridge
