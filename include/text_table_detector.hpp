#pragma once

#include "document_model.hpp"

#include <string>
#include <vector>

// Collapses runs of three or more spaces/tabs to two spaces on every line and
// trims the text. Line breaks are preserved.
std::string preprocessPageText(const std::string& text);

// Pattern-based table detection over plain text. Blank lines separate blocks;
// within a block only lines containing a tab, a double space, '|', ';' or ','
// are kept. The delimiter is picked from the block's first line ('|', then ';',
// then ','), falling back to runs of two or more whitespace characters. Empty
// cells are dropped, and a block becomes a table only when every row has the
// same number of cells and that number is greater than one.
std::vector<Grid> detectTablesInText(const std::string& text);
