#include "row_merger.hpp"

bool isContinuationRow(const std::vector<std::string>& row) {
  if (row.empty()) return false;
  size_t leadingBlank = 0;
  for (const auto& cell : row) {
    if (!isBlank(cell)) break;
    ++leadingBlank;
  }
  return leadingBlank * 2 >= row.size();
}

Grid mergeContinuationRows(const Grid& rows) {
  Grid merged;
  for (const auto& row : rows) {
    if (merged.empty() || !isContinuationRow(row)) {
      merged.push_back(row);
      continue;
    }
    auto& prev = merged.back();
    for (size_t j = 0; j < row.size() && j < prev.size(); ++j) {
      if (isBlank(row[j])) continue;
      if (isBlank(prev[j])) prev[j] = row[j];
      else prev[j] += " " + row[j];
    }
  }
  return merged;
}
