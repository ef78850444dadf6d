#pragma once

#include <string>
#include <variant>
#include <vector>

// A unit of positioned text on a page. Coordinates grow rightwards and downwards.
struct TextFragment {
  std::string text;
  double left = 0.0;
  double top = 0.0;
  double right = 0.0;
  double bottom = 0.0;

  double width() const { return right - left; }
  double height() const { return bottom - top; }
  double centerX() const { return (left + right) / 2.0; }
  double centerY() const { return (top + bottom) / 2.0; }
};

// A clustered x-coordinate that likely marks the left edge of a column.
struct ColumnBoundary {
  double center = 0.0;
  size_t count = 0;
};

// Raw cell text, row-major. The first row is treated as the header wherever a
// grid is interpreted as a table.
using Grid = std::vector<std::vector<std::string>>;

using CellValue = std::variant<std::string, long long, double>;

struct Table {
  std::vector<std::string> columns;
  std::vector<std::vector<CellValue>> rows;

  size_t columnCount() const { return columns.size(); }
  bool empty() const { return columns.empty(); }
};

struct CandidateTable {
  int firstPage = 0;
  int lastPage = 0;
  Grid rows;
};

// Everything the assembler has accumulated so far; persisted at each checkpoint.
struct CandidateTables {
  std::vector<CandidateTable> structured;
  std::vector<CandidateTable> geometry;
  std::vector<CandidateTable> plainText;
};

bool isBlank(const std::string& s);
std::string trim(const std::string& s);
std::string cellToString(const CellValue& value);
bool isNumericCell(const CellValue& value);
size_t gridColumnCount(const Grid& grid);
