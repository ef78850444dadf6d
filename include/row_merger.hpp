#pragma once

#include "document_model.hpp"

// True when at least half of the row's cells are blank before its first
// non-blank cell, i.e. the row is the wrapped tail of the row above it.
bool isContinuationRow(const std::vector<std::string>& row);

// Folds continuation rows into the preceding retained row in one forward pass:
// a blank cell above takes the continuation's text, two non-blank cells are
// joined with a single space. Continuation rows are never emitted on their own.
// The first row is always retained.
Grid mergeContinuationRows(const Grid& rows);
