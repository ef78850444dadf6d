#include "structured_extractor.hpp"

#include <algorithm>
#include <cmath>

namespace {

// Upper median of one fragment measure; 0 for no fragments.
double medianOf(const std::vector<TextFragment>& words, double (TextFragment::*measure)() const) {
  if (words.empty()) return 0.0;
  std::vector<double> values;
  values.reserve(words.size());
  for (const auto& w : words) values.push_back((w.*measure)());
  auto mid = values.begin() + values.size() / 2;
  std::nth_element(values.begin(), mid, values.end());
  return *mid;
}

// A line of words whose vertical centres stay within tolerance of the line's
// running mean centre.
struct WordLine {
  double center = 0.0;
  std::vector<TextFragment> words;

  void add(const TextFragment& w) {
    words.push_back(w);
    center += (w.centerY() - center) / static_cast<double>(words.size());
  }
};

std::vector<WordLine> groupIntoLines(std::vector<TextFragment> words) {
  const double medianHeight = medianOf(words, &TextFragment::height);
  const double tolerance = medianHeight > 0 ? medianHeight * 0.8 : 6.0;

  std::sort(words.begin(), words.end(), [](const TextFragment& a, const TextFragment& b) {
    if (a.centerY() != b.centerY()) return a.centerY() < b.centerY();
    return a.left < b.left;
  });

  std::vector<WordLine> lines;
  for (const auto& w : words) {
    if (lines.empty() || std::abs(w.centerY() - lines.back().center) > tolerance) {
      lines.push_back(WordLine{w.centerY(), {}});
    }
    lines.back().add(w);
  }
  for (auto& line : lines) {
    std::sort(line.words.begin(), line.words.end(),
              [](const TextFragment& a, const TextFragment& b) { return a.left < b.left; });
  }
  return lines;
}

// Chains sorted horizontal centres whose neighbours lie within tolerance; each
// chain becomes one column at its mean centre.
std::vector<ColumnBoundary> wordColumns(const std::vector<TextFragment>& words) {
  std::vector<ColumnBoundary> columns;
  if (words.empty()) return columns;
  const double tolerance = std::max(8.0, medianOf(words, &TextFragment::width) * 1.2);

  std::vector<double> centers;
  centers.reserve(words.size());
  for (const auto& w : words) centers.push_back(w.centerX());
  std::sort(centers.begin(), centers.end());

  double sum = centers.front();
  columns.push_back(ColumnBoundary{centers.front(), 1});
  for (size_t i = 1; i < centers.size(); ++i) {
    if (centers[i] - centers[i - 1] > tolerance) {
      columns.back().center = sum / static_cast<double>(columns.back().count);
      columns.push_back(ColumnBoundary{centers[i], 0});
      sum = 0.0;
    }
    sum += centers[i];
    columns.back().count++;
  }
  columns.back().center = sum / static_cast<double>(columns.back().count);
  return columns;
}

size_t nearestColumn(double x, const std::vector<ColumnBoundary>& columns) {
  auto best = std::min_element(columns.begin(), columns.end(),
                               [x](const ColumnBoundary& a, const ColumnBoundary& b) {
                                 return std::abs(x - a.center) < std::abs(x - b.center);
                               });
  return static_cast<size_t>(best - columns.begin());
}

bool looksTabular(const Grid& grid) {
  const auto multiCell = std::count_if(grid.begin(), grid.end(), [](const std::vector<std::string>& row) {
    return std::count_if(row.begin(), row.end(), [](const std::string& c) { return !c.empty(); }) >= 2;
  });
  return static_cast<size_t>(multiCell) * 2 >= grid.size();
}

} // namespace

std::optional<Grid> extractStructuredTable(std::vector<TextFragment> words) {
  words.erase(std::remove_if(words.begin(), words.end(),
                             [](const TextFragment& w) { return isBlank(w.text); }),
              words.end());

  const std::vector<WordLine> lines = groupIntoLines(words);
  if (lines.size() < 2) return std::nullopt;
  const std::vector<ColumnBoundary> columns = wordColumns(words);
  if (columns.size() < 2) return std::nullopt;

  Grid grid;
  grid.reserve(lines.size());
  for (const auto& line : lines) {
    std::vector<std::string> cells(columns.size());
    for (const auto& w : line.words) {
      std::string& cell = cells[nearestColumn(w.centerX(), columns)];
      if (!cell.empty()) cell += ' ';
      cell += w.text;
    }
    grid.push_back(std::move(cells));
  }
  if (!looksTabular(grid)) return std::nullopt;
  return grid;
}
