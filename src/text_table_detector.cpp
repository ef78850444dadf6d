#include "text_table_detector.hpp"

#include <optional>
#include <regex>
#include <sstream>

namespace {

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

bool looksTabular(const std::string& line) {
  return line.find('\t') != std::string::npos || line.find("  ") != std::string::npos ||
         line.find_first_of("|;,") != std::string::npos;
}

std::vector<std::string> splitCells(const std::string& line, char delimiter) {
  std::vector<std::string> cells;
  if (delimiter) {
    std::string cell;
    std::istringstream in(line);
    while (std::getline(in, cell, delimiter)) cells.push_back(trim(cell));
    if (!line.empty() && line.back() == delimiter) cells.push_back("");
  } else {
    static const std::regex gap("\\s{2,}");
    std::sregex_token_iterator it(line.begin(), line.end(), gap, -1), end;
    for (; it != end; ++it) cells.push_back(*it);
  }
  std::vector<std::string> nonEmpty;
  for (auto& c : cells) {
    if (!c.empty()) nonEmpty.push_back(std::move(c));
  }
  return nonEmpty;
}

std::optional<Grid> blockToTable(const std::vector<std::string>& block) {
  const std::string& sample = block.front();
  char delimiter = 0;
  if (sample.find('|') != std::string::npos) delimiter = '|';
  else if (sample.find(';') != std::string::npos) delimiter = ';';
  else if (sample.find(',') != std::string::npos) delimiter = ',';

  Grid rows;
  for (const auto& line : block) {
    auto cells = splitCells(line, delimiter);
    if (!cells.empty()) rows.push_back(std::move(cells));
  }
  if (rows.empty()) return std::nullopt;

  const size_t numCols = rows.front().size();
  if (numCols <= 1) return std::nullopt;
  for (const auto& row : rows) {
    if (row.size() != numCols) return std::nullopt;
  }
  return rows;
}

} // namespace

std::string preprocessPageText(const std::string& text) {
  static const std::regex wideGap("[ \\t]{3,}");
  std::string out;
  for (const auto& line : splitLines(text)) {
    if (!out.empty()) out += '\n';
    out += std::regex_replace(line, wideGap, "  ");
  }
  return trim(out);
}

std::vector<Grid> detectTablesInText(const std::string& text) {
  std::vector<std::vector<std::string>> blocks;
  std::vector<std::string> current;
  for (const auto& raw : splitLines(text)) {
    std::string line = trim(raw);
    if (line.empty()) {
      if (!current.empty()) blocks.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (looksTabular(line)) current.push_back(line);
  }
  if (!current.empty()) blocks.push_back(std::move(current));

  std::vector<Grid> tables;
  for (const auto& block : blocks) {
    if (auto table = blockToTable(block)) tables.push_back(std::move(*table));
  }
  return tables;
}
