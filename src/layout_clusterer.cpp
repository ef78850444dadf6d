#include "layout_clusterer.hpp"

#include <algorithm>
#include <cmath>

std::vector<FragmentRow> groupIntoRows(std::vector<TextFragment> fragments, double rowTolerance) {
  std::vector<FragmentRow> rows;
  if (fragments.empty()) return rows;

  std::stable_sort(fragments.begin(), fragments.end(),
                   [](const TextFragment& a, const TextFragment& b) { return a.top < b.top; });

  auto byLeft = [](const TextFragment& a, const TextFragment& b) { return a.left < b.left; };

  FragmentRow current{fragments.front()};
  double bottom = fragments.front().bottom;
  for (size_t i = 1; i < fragments.size(); ++i) {
    const TextFragment& f = fragments[i];
    // One-sided on purpose; overlapping fragments never split a row.
    if (f.top - bottom < rowTolerance) {
      current.push_back(f);
      bottom = std::max(bottom, f.bottom);
    } else {
      std::stable_sort(current.begin(), current.end(), byLeft);
      rows.push_back(std::move(current));
      current = FragmentRow{f};
      bottom = f.bottom;
    }
  }
  std::stable_sort(current.begin(), current.end(), byLeft);
  rows.push_back(std::move(current));
  return rows;
}

std::vector<ColumnBoundary> detectColumnBoundaries(const std::vector<TextFragment>& fragments,
                                                   const PipelineOptions& options) {
  std::vector<double> lefts;
  lefts.reserve(fragments.size());
  for (const auto& f : fragments) lefts.push_back(f.left);
  std::sort(lefts.begin(), lefts.end());

  struct Cluster { double sum; size_t count; double center() const { return sum / count; } };
  std::vector<Cluster> clusters;
  for (double x : lefts) {
    auto it = std::find_if(clusters.begin(), clusters.end(), [&](const Cluster& c) {
      return std::abs(c.center() - x) <= options.columnTolerance;
    });
    if (it != clusters.end()) {
      it->sum += x;
      it->count++;
    } else {
      clusters.push_back(Cluster{x, 1});
    }
  }

  const size_t shareMin = static_cast<size_t>(std::floor(options.minColumnShare * fragments.size()));
  const size_t minOccurrences = std::max(options.minColumnOccurrences, shareMin);

  std::vector<ColumnBoundary> boundaries;
  for (const auto& c : clusters) {
    if (c.count >= minOccurrences) boundaries.push_back(ColumnBoundary{c.center(), c.count});
  }
  std::sort(boundaries.begin(), boundaries.end(),
            [](const ColumnBoundary& a, const ColumnBoundary& b) { return a.center < b.center; });
  return boundaries;
}

size_t assignColumn(double left, const std::vector<ColumnBoundary>& boundaries, double columnTolerance) {
  size_t col = 0;
  for (size_t i = 0; i < boundaries.size(); ++i) {
    if (boundaries[i].center <= left + columnTolerance) col = i;
  }
  return col;
}

Grid clusterLayout(const std::vector<TextFragment>& fragments, const PipelineOptions& options) {
  Grid grid;
  if (fragments.empty()) return grid;

  const std::vector<ColumnBoundary> boundaries = detectColumnBoundaries(fragments, options);
  const size_t numCols = std::max<size_t>(1, boundaries.size());

  for (const auto& row : groupIntoRows(fragments, options.rowTolerance)) {
    std::vector<std::string> cells(numCols);
    for (const auto& f : row) {
      if (isBlank(f.text)) continue;
      std::string& cell = cells[assignColumn(f.left, boundaries, options.columnTolerance)];
      if (!cell.empty()) cell += ' ';
      cell += trim(f.text);
    }
    bool anyText = std::any_of(cells.begin(), cells.end(), [](const std::string& c) { return !c.empty(); });
    if (anyText) grid.push_back(std::move(cells));
  }
  return grid;
}
