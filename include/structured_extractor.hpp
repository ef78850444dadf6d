#pragma once

#include "document_model.hpp"

#include <optional>
#include <vector>

// Word-level table detection for a single page: words are clustered into rows
// by vertical centre and into columns by horizontal centre, then each word is
// placed in its nearest column. Returns a grid (header first) only when the page
// looks tabular: at least 2 rows, at least 2 columns, and at least half of the
// rows filling 2 or more cells.
std::optional<Grid> extractStructuredTable(std::vector<TextFragment> words);
