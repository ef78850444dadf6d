#include <catch2/catch_all.hpp>

#include "errors.hpp"
#include "table_writer.hpp"
#include "test_support.hpp"

#include <zip.h>

#include <fstream>
#include <sstream>

using Catch::Approx;

namespace {

std::string slurp(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  return buffer.str();
}

// Inflated contents of one archive entry; empty when the entry is missing.
std::string zipEntry(const std::filesystem::path& archivePath, const std::string& name) {
  int error = 0;
  zip_t* archive = zip_open(archivePath.c_str(), ZIP_RDONLY, &error);
  if (!archive) return {};
  std::string contents;
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive, name.c_str(), 0, &stat) == 0) {
    if (zip_file_t* file = zip_fopen(archive, name.c_str(), 0)) {
      contents.resize(stat.size);
      const zip_int64_t got = zip_fread(file, &contents[0], stat.size);
      zip_fclose(file);
      if (got < 0 || static_cast<zip_uint64_t>(got) != stat.size) contents.clear();
    }
  }
  zip_close(archive);
  return contents;
}

Table sampleTable() {
  Table table;
  table.columns = {"Name", "Qty"};
  table.rows = {
    {CellValue(std::string("Apple \"Gala\"")), CellValue(5LL)},
    {CellValue(std::string("two\nlines")), CellValue(2.5)},
  };
  return table;
}

} // namespace

TEST_CASE("renderCsv writes BOM, full quoting and CRLF", "[writer]") {
  const std::string csv = renderCsv(sampleTable());
  const std::string expected =
    "\xEF\xBB\xBF"
    "\"Name\",\"Qty\"\r\n"
    "\"Apple \"\"Gala\"\"\",\"5\"\r\n"
    "\"two lines\",\"2.5\"\r\n";
  REQUIRE(csv == expected);
}

TEST_CASE("a comma inside a cell switches the delimiter to tab", "[writer]") {
  Table table = sampleTable();
  table.rows.push_back({CellValue(std::string("Pears, green")), CellValue(7LL)});
  REQUIRE(chooseCsvDelimiter(table) == '\t');
  const std::string csv = renderCsv(table);
  REQUIRE(csv.find("\"Name\"\t\"Qty\"\r\n") != std::string::npos);
  REQUIRE(csv.find("\"Pears, green\"\t\"7\"\r\n") != std::string::npos);

  REQUIRE(chooseCsvDelimiter(sampleTable()) == ',');
}

TEST_CASE("an empty table renders as a bare BOM", "[writer]") {
  REQUIRE(renderCsv(Table{}) == "\xEF\xBB\xBF");
}

TEST_CASE("xlsxColumnWidth is capped", "[writer]") {
  REQUIRE(xlsxColumnWidth(3) == Approx(6.0));
  REQUIRE(xlsxColumnWidth(0) == Approx(2.4));
  REQUIRE(xlsxColumnWidth(100) == Approx(50.0));
}

TEST_CASE("writeXlsx produces a zip package", "[writer]") {
  ScratchDir dir;
  const auto path = dir.path() / "out" / "table.xlsx";
  writeXlsx(sampleTable(), path);

  const std::string bytes = slurp(path);
  REQUIRE(bytes.compare(0, 4, "PK\x03\x04") == 0);
  REQUIRE(zipEntry(path, "[Content_Types].xml").find("worksheet+xml") != std::string::npos);
  REQUIRE(zipEntry(path, "_rels/.rels").find("xl/workbook.xml") != std::string::npos);
  REQUIRE(zipEntry(path, "xl/_rels/workbook.xml.rels").find("worksheets/sheet1.xml") != std::string::npos);
}

TEST_CASE("a styled workbook has one Data sheet with header, text and number styles", "[writer]") {
  ScratchDir dir;
  const auto path = dir.path() / "styled.xlsx";
  writeXlsx(sampleTable(), path);

  const std::string workbook = zipEntry(path, "xl/workbook.xml");
  REQUIRE(workbook.find("<sheet name=\"Data\" sheetId=\"1\"") != std::string::npos);

  const std::string styles = zipEntry(path, "xl/styles.xml");
  REQUIRE(styles.find("<font><b/><sz val=\"12\"/>") != std::string::npos);
  REQUIRE(styles.find("<fgColor rgb=\"FFE0E0E0\"/>") != std::string::npos);
  REQUIRE(styles.find("<left style=\"thin\"/>") != std::string::npos);
  REQUIRE(styles.find("<alignment horizontal=\"right\"/>") != std::string::npos);

  const std::string sheet = zipEntry(path, "xl/worksheets/sheet1.xml");
  REQUIRE(sheet.find("<c r=\"A1\" t=\"inlineStr\" s=\"1\"><is><t xml:space=\"preserve\">Name</t>") !=
          std::string::npos);
  REQUIRE(sheet.find("<c r=\"B1\" t=\"inlineStr\" s=\"1\">") != std::string::npos);
  REQUIRE(sheet.find("<c r=\"A2\" t=\"inlineStr\" s=\"2\"><is><t xml:space=\"preserve\">Apple &quot;Gala&quot;</t>") !=
          std::string::npos);
  REQUIRE(sheet.find("<c r=\"B2\" s=\"3\"><v>5</v></c>") != std::string::npos);
  REQUIRE(sheet.find("<c r=\"B3\" s=\"3\"><v>2.5</v></c>") != std::string::npos);
  // Widest column 0 value is "Apple \"Gala\"" (12 chars): (12 + 2) * 1.2.
  REQUIRE(sheet.find("<col min=\"1\" max=\"1\" width=\"16.80\" customWidth=\"1\"/>") != std::string::npos);
}

TEST_CASE("an unstyled workbook carries no cell styles or widths", "[writer]") {
  ScratchDir dir;
  const auto path = dir.path() / "plain.xlsx";
  writeXlsx(sampleTable(), path, false);

  const std::string sheet = zipEntry(path, "xl/worksheets/sheet1.xml");
  REQUIRE(sheet.find("<sheetData>") != std::string::npos);
  REQUIRE(sheet.find(" s=\"") == std::string::npos);
  REQUIRE(sheet.find("<cols>") == std::string::npos);
  REQUIRE(zipEntry(path, "xl/workbook.xml").find("name=\"Data\"") != std::string::npos);
}

TEST_CASE("writeArtifact writes the requested format", "[writer]") {
  ScratchDir dir;

  writeArtifact(sampleTable(), OutputFormat::Csv, dir.path() / "a.csv");
  REQUIRE(slurp(dir.path() / "a.csv") == renderCsv(sampleTable()));

  writeArtifact(sampleTable(), OutputFormat::Xlsx, dir.path() / "a.xlsx");
  REQUIRE(zipEntry(dir.path() / "a.xlsx", "xl/worksheets/sheet1.xml").find(" s=\"1\"") != std::string::npos);
}

TEST_CASE("writeArtifact falls back to the minimal writer when the full one fails", "[writer]") {
  ScratchDir dir;
  const auto path = dir.path() / "fallback.csv";
  int fullCalls = 0;

  SECTION("full writer throws") {
    ArtifactWriters writers = artifactWriters(OutputFormat::Csv);
    writers.full = [&](const Table&, const std::filesystem::path&) {
      ++fullCalls;
      throw IoFailure("disk full");
    };
    writeArtifact(sampleTable(), path, writers);
  }

  SECTION("full writer leaves an empty file") {
    ArtifactWriters writers = artifactWriters(OutputFormat::Csv);
    writers.full = [&](const Table&, const std::filesystem::path& target) {
      ++fullCalls;
      std::ofstream touch(target);
    };
    writeArtifact(sampleTable(), path, writers);
  }

  REQUIRE(fullCalls == 1);
  const std::string expected =
    "\xEF\xBB\xBF"
    "Name,Qty\n"
    "\"Apple \"\"Gala\"\"\",5\n"
    "\"two\nlines\",2.5\n";
  REQUIRE(slurp(path) == expected);
}

TEST_CASE("the xlsx fallback writes an unstyled workbook", "[writer]") {
  ScratchDir dir;
  const auto path = dir.path() / "fallback.xlsx";
  ArtifactWriters writers = artifactWriters(OutputFormat::Xlsx);
  writers.full = [](const Table&, const std::filesystem::path&) { throw IoFailure("styles rejected"); };
  writeArtifact(sampleTable(), path, writers);

  const std::string sheet = zipEntry(path, "xl/worksheets/sheet1.xml");
  REQUIRE(sheet.find("Apple &quot;Gala&quot;") != std::string::npos);
  REQUIRE(sheet.find(" s=\"") == std::string::npos);
}

TEST_CASE("writeArtifact reports failure when no writer can save", "[writer]") {
  ScratchDir dir;
  // A directory in place of the target file defeats both writers.
  std::filesystem::create_directories(dir.path() / "taken.csv");
  REQUIRE_THROWS_AS(writeArtifact(sampleTable(), OutputFormat::Csv, dir.path() / "taken.csv"), IoFailure);
}
