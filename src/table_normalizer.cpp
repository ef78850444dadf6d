#include "table_normalizer.hpp"
#include "rtl_text.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>

std::string sanitizeColumnName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    switch (c) {
      case '[': case ']': case '\\': case '/': case '*': case '?': case ':': case '\'':
        break;
      default:
        out.push_back(c);
    }
  }
  return trim(out);
}

std::optional<CellValue> parseNumber(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (char c : text) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) continue;
    cleaned.push_back(c);
  }
  if (cleaned.empty()) return std::nullopt;

  const char* begin = cleaned.c_str();
  char* end = nullptr;
  if (cleaned.find_first_of(".eE") == std::string::npos) {
    errno = 0;
    long long i = std::strtoll(begin, &end, 10);
    if (*end == '\0' && errno != ERANGE) return CellValue(i);
  }
  errno = 0;
  double d = std::strtod(begin, &end);
  if (*end != '\0' || errno == ERANGE || !std::isfinite(d)) return std::nullopt;
  // strtod also takes hex floats and "nan"/"inf" spellings; plain decimals only.
  if (cleaned.find_first_of("xXnNiI") != std::string::npos) return std::nullopt;
  return CellValue(d);
}

namespace {

std::vector<std::string> buildHeader(std::vector<std::string> raw) {
  std::vector<std::string> header;
  std::set<std::string> seen;
  for (size_t i = 0; i < raw.size(); ++i) {
    std::string name = sanitizeColumnName(fixRtlText(trim(raw[i])));
    if (name.empty() || seen.count(name)) {
      name = "Column " + std::to_string(i + 1);
      for (int suffix = 2; seen.count(name); ++suffix) {
        name = "Column " + std::to_string(i + 1) + "_" + std::to_string(suffix);
      }
    }
    seen.insert(name);
    header.push_back(std::move(name));
  }
  return header;
}

} // namespace

Table normalizeTable(const Grid& grid, double numericThreshold) {
  Table table;
  if (grid.empty()) return table;

  const size_t numCols = gridColumnCount(grid);
  std::vector<std::string> headerRow = grid.front();
  headerRow.resize(numCols);
  table.columns = buildHeader(std::move(headerRow));

  std::vector<std::vector<std::string>> data;
  for (size_t r = 1; r < grid.size(); ++r) {
    std::vector<std::string> row = grid[r];
    row.resize(numCols);
    bool anyText = false;
    for (auto& cell : row) {
      cell = trim(cell);
      anyText = anyText || !cell.empty();
    }
    if (anyText) data.push_back(std::move(row));
  }

  std::vector<bool> numeric(numCols, false);
  for (size_t c = 0; c < numCols; ++c) {
    size_t nonBlank = 0, parsed = 0;
    for (const auto& row : data) {
      if (row[c].empty()) continue;
      ++nonBlank;
      if (parseNumber(row[c])) ++parsed;
    }
    numeric[c] = nonBlank > 0 && static_cast<double>(parsed) >= numericThreshold * nonBlank;
  }

  table.rows.reserve(data.size());
  for (const auto& row : data) {
    std::vector<CellValue> out;
    out.reserve(numCols);
    for (size_t c = 0; c < numCols; ++c) {
      if (numeric[c] && !row[c].empty()) {
        auto number = parseNumber(row[c]);
        out.push_back(number ? *number : CellValue(std::string()));
      } else {
        out.push_back(fixRtlText(row[c]));
      }
    }
    table.rows.push_back(std::move(out));
  }
  return table;
}
