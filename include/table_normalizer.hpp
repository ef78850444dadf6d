#pragma once

#include "document_model.hpp"

#include <optional>
#include <string>

// Removes characters spreadsheet column identifiers cannot hold ([ ] \ / * ? : ')
// and surrounding whitespace. May return an empty string.
std::string sanitizeColumnName(const std::string& name);

// Parses a cell as a number after removing thousands separators (',') and all
// whitespace. Values without '.', 'e' or 'E' become integers when they fit.
// Non-finite results are rejected.
std::optional<CellValue> parseNumber(const std::string& text);

// Turns a raw grid (first row = header) into a typed table:
//  - every row padded with blanks or truncated to the widest row's length;
//  - header cells RTL-fixed and sanitized; empty or duplicate names replaced
//    by "Column N" (1-based position);
//  - data cells trimmed, rows that are entirely blank dropped;
//  - a column whose non-blank cells parse as numbers in at least
//    `numericThreshold` of cases is converted, unparsable cells become blank;
//  - remaining string cells containing RTL script are shaped and reordered.
Table normalizeTable(const Grid& grid, double numericThreshold);
