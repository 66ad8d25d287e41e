#include "fris/core/CsvReader.hpp"
#include "fris/core/Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fris {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(start, end - start + 1);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

bool parseNumber(const std::string& cell, double& out) {
    if (cell.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(cell.c_str(), &end);
    return errno == 0 && end == cell.c_str() + cell.size();
}

} // namespace

std::vector<RawRecord> CsvReader::readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw InputError("cannot open CSV file: " + path);
    }
    return read(in);
}

std::vector<RawRecord> CsvReader::read(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw InputError("CSV input is empty");
    }
    const std::vector<std::string> header = splitLine(line);

    std::vector<RawRecord> rows;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<std::string> cells = splitLine(line);
        if (cells.size() != header.size()) {
            throw InputError("CSV line " + std::to_string(line_no) + " has " +
                             std::to_string(cells.size()) + " cells, expected " +
                             std::to_string(header.size()));
        }

        RawRecord rec;
        for (size_t i = 0; i < header.size(); ++i) {
            if (cells[i].empty()) continue;
            double num = 0.0;
            if (parseNumber(cells[i], num)) {
                rec.set(header[i], num);
            } else {
                rec.set(header[i], cells[i]);
            }
        }
        rows.push_back(std::move(rec));
    }
    return rows;
}

} // namespace fris
