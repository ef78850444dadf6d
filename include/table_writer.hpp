#pragma once

#include "document_model.hpp"
#include "session.hpp"

#include <filesystem>
#include <functional>
#include <string>

// ',' unless some data cell contains a comma, then '\t'.
char chooseCsvDelimiter(const Table& table);

// UTF-8 with BOM, CRLF line endings, every field quoted, embedded quotes
// doubled and line breaks inside string cells replaced by spaces.
std::string renderCsv(const Table& table);

// Writes renderCsv() output. Throws IoFailure.
void writeCsv(const Table& table, const std::filesystem::path& path);

// Fallback CSV: BOM, comma delimiter, quotes only where needed, '\n' endings.
void writeCsvMinimal(const Table& table, const std::filesystem::path& path);

// Column width used for a column whose longest value has `longest` characters:
// min((longest + 2) * 1.2, 50).
double xlsxColumnWidth(size_t longest);

// Single-sheet workbook, sheet "Data". When styled, the header row is bold 12pt
// on a light grey fill and centred, all cells get thin borders, numeric cells
// are right aligned and column widths follow xlsxColumnWidth(). Throws
// IoFailure.
void writeXlsx(const Table& table, const std::filesystem::path& path, bool styled = true);

using TableFileWriter = std::function<void(const Table&, const std::filesystem::path&)>;

// Full writer and fallback writer for one output format.
struct ArtifactWriters {
  TableFileWriter full;
  TableFileWriter minimal;
};

ArtifactWriters artifactWriters(OutputFormat format);

// Runs writers.full. If it throws IoFailure or leaves a missing or empty file,
// writers.minimal is run instead and its IoFailure propagates.
void writeArtifact(const Table& table, const std::filesystem::path& path, const ArtifactWriters& writers);

// writeArtifact() with the writers for `format`.
void writeArtifact(const Table& table, OutputFormat format, const std::filesystem::path& path);
