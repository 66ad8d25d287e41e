#pragma once
// =============================================================================
// CsvReader.hpp - Training CSV -> RawRecords
// =============================================================================
// Header row names the fields. Cells that parse fully as numbers become
// doubles, anything else stays text, empty cells are treated as absent.
// No quoting beyond plain double-quoted cells without embedded quotes.
// =============================================================================

#include "fris/core/RawRecord.hpp"

#include <istream>
#include <string>
#include <vector>

namespace fris {

class CsvReader {
public:
    static std::vector<RawRecord> readFile(const std::string& path);
    static std::vector<RawRecord> read(std::istream& in);
};

} // namespace fris
