#pragma once

#include "config.hpp"
#include "document_model.hpp"

#include <vector>

// Fragments sharing a vertical band, sorted left to right.
using FragmentRow = std::vector<TextFragment>;

// Sorts fragments by top edge and scans them once: a fragment joins the current
// row while its top lies less than `rowTolerance` below the row's running bottom
// edge, otherwise it opens a new row. The test is one-sided: a fragment that
// starts above the running bottom always joins, however far above, unlike a
// comparison on the absolute distance.
std::vector<FragmentRow> groupIntoRows(std::vector<TextFragment> fragments, double rowTolerance);

// Clusters left edges in ascending order; each position joins the first cluster
// whose running mean is within `columnTolerance`. Clusters smaller than
// max(minColumnOccurrences, floor(minColumnShare * fragment count)) are dropped.
// Result is sorted by center.
std::vector<ColumnBoundary> detectColumnBoundaries(const std::vector<TextFragment>& fragments,
                                                   const PipelineOptions& options);

// Index of the right-most boundary with center <= left + columnTolerance; 0 when
// the fragment lies left of every boundary.
size_t assignColumn(double left, const std::vector<ColumnBoundary>& boundaries, double columnTolerance);

// Full page reconstruction. Cells hold the space-joined texts of their
// fragments in left-to-right order. Rows with no text are skipped; the grid has
// max(1, boundary count) columns, and is empty when there are no fragments.
Grid clusterLayout(const std::vector<TextFragment>& fragments, const PipelineOptions& options);
