#include "table_assembler.hpp"
#include "table_normalizer.hpp"

#include <spdlog/spdlog.h>

TableAssembler::TableAssembler(const PipelineOptions& options, CandidateTables initial)
  : options_(options), candidates_(std::move(initial)) {}

void TableAssembler::addStructuredTable(int page, Grid grid) {
  if (grid.empty()) return;
  candidates_.structured.push_back(CandidateTable{page, page, std::move(grid)});
}

void TableAssembler::addGeometryGrid(int page, Grid grid) {
  if (grid.empty()) return;
  auto& list = candidates_.geometry;
  if (!list.empty() && list.back().lastPage + 1 == page &&
      gridColumnCount(list.back().rows) == gridColumnCount(grid)) {
    CandidateTable& current = list.back();
    const auto& header = current.rows.front();
    size_t skip = 0;
    while (skip < grid.size() && grid[skip] == header) ++skip;
    current.rows.insert(current.rows.end(),
                        std::make_move_iterator(grid.begin() + skip),
                        std::make_move_iterator(grid.end()));
    current.lastPage = page;
    return;
  }
  list.push_back(CandidateTable{page, page, std::move(grid)});
}

void TableAssembler::addTextTable(int page, Grid grid) {
  if (grid.empty()) return;
  candidates_.plainText.push_back(CandidateTable{page, page, std::move(grid)});
}

Table TableAssembler::assemble() const {
  struct Ranked { const char* name; const std::vector<CandidateTable>* list; double threshold; };
  const Ranked ranked[] = {
    {"structured", &candidates_.structured, options_.structuredNumericThreshold},
    {"geometry", &candidates_.geometry, options_.geometryNumericThreshold},
    {"plain-text", &candidates_.plainText, options_.geometryNumericThreshold},
  };

  for (const auto& source : ranked) {
    if (source.list->empty()) continue;
    Table table = assembleFrom(*source.list, source.threshold);
    if (!table.empty()) {
      spdlog::debug("Assembled {} rows x {} columns from {} candidates",
                    table.rows.size(), table.columnCount(), source.name);
      return table;
    }
  }
  return Table{};
}

Table TableAssembler::assembleFrom(const std::vector<CandidateTable>& list, double numericThreshold) const {
  // Normalizing the concatenated grid keeps column typing consistent across the
  // appended candidates.
  std::vector<const CandidateTable*> usable;
  for (const auto& c : list) {
    if (gridColumnCount(c.rows) >= 2) usable.push_back(&c);
  }
  if (usable.empty()) return Table{};

  auto area = [](const CandidateTable* c) {
    size_t dataRows = c->rows.empty() ? 0 : c->rows.size() - 1;
    return dataRows * gridColumnCount(c->rows);
  };
  const CandidateTable* primary = usable.front();
  for (const auto* c : usable) {
    if (area(c) > area(primary)) primary = c;
  }

  const size_t width = gridColumnCount(primary->rows);
  Grid combined = primary->rows;
  for (const auto* c : usable) {
    if (c == primary || gridColumnCount(c->rows) != width) continue;
    combined.insert(combined.end(), c->rows.begin() + 1, c->rows.end());
  }
  return normalizeTable(combined, numericThreshold);
}
