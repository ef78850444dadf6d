#include "table_writer.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace fs = std::filesystem;

namespace {

const char* kUtf8Bom = "\xEF\xBB\xBF";

std::string flattenLineBreaks(std::string s) {
  for (auto& c : s) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return s;
}

std::string quoted(const std::string& cell) {
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

void writeFile(const fs::path& path, const std::string& content) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) throw IoFailure("cannot open " + path.string() + " for writing");
  ofs << content;
  ofs.flush();
  if (!ofs) throw IoFailure("failed writing " + path.string());
}

} // namespace

char chooseCsvDelimiter(const Table& table) {
  for (const auto& row : table.rows) {
    for (const auto& cell : row) {
      if (!isNumericCell(cell) && std::get<std::string>(cell).find(',') != std::string::npos) return '\t';
    }
  }
  return ',';
}

std::string renderCsv(const Table& table) {
  std::string out = kUtf8Bom;
  if (table.empty()) return out;
  const char delimiter = chooseCsvDelimiter(table);

  auto writeRow = [&](const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
      out += quoted(row[i]);
      if (i + 1 < row.size()) out += delimiter;
    }
    out += "\r\n";
  };

  writeRow(table.columns);
  for (const auto& r : table.rows) {
    std::vector<std::string> cells;
    cells.reserve(r.size());
    for (const auto& cell : r) cells.push_back(flattenLineBreaks(cellToString(cell)));
    writeRow(cells);
  }
  return out;
}

void writeCsv(const Table& table, const fs::path& path) {
  writeFile(path, renderCsv(table));
}

void writeCsvMinimal(const Table& table, const fs::path& path) {
  std::string out = kUtf8Bom;
  auto writeRow = [&](const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
      const std::string& cell = row[i];
      bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                        cell.find('\n') != std::string::npos;
      out += needQuotes ? quoted(cell) : cell;
      if (i + 1 < row.size()) out += ',';
    }
    out += "\n";
  };

  if (!table.empty()) {
    writeRow(table.columns);
    for (const auto& r : table.rows) {
      std::vector<std::string> cells;
      for (const auto& cell : r) cells.push_back(cellToString(cell));
      writeRow(cells);
    }
  }
  writeFile(path, out);
}

ArtifactWriters artifactWriters(OutputFormat format) {
  if (format == OutputFormat::Csv) return {writeCsv, writeCsvMinimal};
  return {[](const Table& table, const fs::path& path) { writeXlsx(table, path, true); },
          [](const Table& table, const fs::path& path) { writeXlsx(table, path, false); }};
}

void writeArtifact(const Table& table, const fs::path& path, const ArtifactWriters& writers) {
  try {
    writers.full(table, path);

    std::error_code ec;
    if (fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec) return;
    spdlog::error("Output file not properly saved: {}", path.string());
  } catch (const IoFailure& ex) {
    spdlog::error("Error saving {}: {}", path.string(), ex.what());
  }

  spdlog::info("Retrying {} with the minimal writer", path.string());
  writers.minimal(table, path);
}

void writeArtifact(const Table& table, OutputFormat format, const fs::path& path) {
  writeArtifact(table, path, artifactWriters(format));
}
