#include "table_writer.hpp"
#include "errors.hpp"

#include <zip.h>

#include <algorithm>
#include <cstdio>
#include <deque>

namespace fs = std::filesystem;

namespace {

// Owns a libzip archive opened for writing. Parts are buffered until close();
// an archive that is never closed is discarded.
class ZipWriter {
public:
  explicit ZipWriter(const fs::path& path) : path_(path) {
    int error = 0;
    archive_ = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
    if (!archive_) {
      zip_error_t zipError;
      zip_error_init_with_code(&zipError, error);
      const std::string message = zip_error_strerror(&zipError);
      zip_error_fini(&zipError);
      throw IoFailure("cannot create " + path.string() + ": " + message);
    }
  }

  ~ZipWriter() {
    if (archive_) zip_discard(archive_);
  }

  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void add(const std::string& name, std::string content) {
    // libzip reads the buffer at close time, so it must stay put until then.
    parts_.push_back(std::move(content));
    const std::string& data = parts_.back();
    zip_source_t* source = zip_source_buffer(archive_, data.data(), data.size(), 0);
    if (!source) fail("cannot buffer " + name);
    const zip_int64_t index = zip_file_add(archive_, name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
    if (index < 0) {
      zip_source_free(source);
      fail("cannot add " + name);
    }
    if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), ZIP_CM_DEFLATE, 0) < 0) {
      fail("cannot compress " + name);
    }
  }

  void close() {
    if (zip_close(archive_) < 0) fail("cannot write " + path_.string());
    archive_ = nullptr;
  }

private:
  void fail(const std::string& what) {
    throw IoFailure(what + ": " + zip_strerror(archive_));
  }

  fs::path path_;
  zip_t* archive_ = nullptr;
  std::deque<std::string> parts_;
};

std::string xmlEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:
        // XML 1.0 forbids most C0 controls.
        if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
        out.push_back(c);
    }
  }
  return out;
}

std::string columnLetters(size_t index) {
  std::string letters;
  ++index;
  while (index > 0) {
    size_t rem = (index - 1) % 26;
    letters.insert(letters.begin(), static_cast<char>('A' + rem));
    index = (index - 1) / 26;
  }
  return letters;
}

size_t utf8Length(const std::string& s) {
  return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

// Cell style indices into cellXfs below.
enum : int { kStyleDefault = 0, kStyleHeader = 1, kStyleBordered = 2, kStyleNumber = 3 };

std::string stringCell(const std::string& ref, const std::string& text, int style) {
  std::string out = "<c r=\"" + ref + "\" t=\"inlineStr\"";
  if (style) out += " s=\"" + std::to_string(style) + "\"";
  return out + "><is><t xml:space=\"preserve\">" + xmlEscape(text) + "</t></is></c>";
}

std::string numberCell(const std::string& ref, const std::string& value, int style) {
  std::string out = "<c r=\"" + ref + "\"";
  if (style) out += " s=\"" + std::to_string(style) + "\"";
  return out + "><v>" + value + "</v></c>";
}

std::string sheetXml(const Table& table, bool styled) {
  std::string xml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">";

  if (styled && !table.columns.empty()) {
    xml += "<cols>";
    for (size_t c = 0; c < table.columns.size(); ++c) {
      size_t longest = utf8Length(table.columns[c]);
      for (const auto& row : table.rows) {
        if (c < row.size()) longest = std::max(longest, utf8Length(cellToString(row[c])));
      }
      char width[32];
      std::snprintf(width, sizeof(width), "%.2f", xlsxColumnWidth(longest));
      const std::string n = std::to_string(c + 1);
      xml += "<col min=\"" + n + "\" max=\"" + n + "\" width=\"" + width + "\" customWidth=\"1\"/>";
    }
    xml += "</cols>";
  }

  xml += "<sheetData>";
  if (!table.columns.empty()) {
    xml += "<row r=\"1\">";
    for (size_t c = 0; c < table.columns.size(); ++c) {
      xml += stringCell(columnLetters(c) + "1", table.columns[c], styled ? kStyleHeader : kStyleDefault);
    }
    xml += "</row>";
  }
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const std::string rowNum = std::to_string(r + 2);
    xml += "<row r=\"" + rowNum + "\">";
    for (size_t c = 0; c < table.rows[r].size(); ++c) {
      const CellValue& cell = table.rows[r][c];
      const std::string ref = columnLetters(c) + rowNum;
      const std::string text = cellToString(cell);
      if (isNumericCell(cell) && !text.empty()) {
        xml += numberCell(ref, text, styled ? kStyleNumber : kStyleDefault);
      } else {
        xml += stringCell(ref, text, styled ? kStyleBordered : kStyleDefault);
      }
    }
    xml += "</row>";
  }
  xml += "</sheetData></worksheet>";
  return xml;
}

const char* kStylesXml =
  "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
  "<styleSheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
  "<fonts count=\"2\">"
  "<font><sz val=\"11\"/><name val=\"Calibri\"/></font>"
  "<font><b/><sz val=\"12\"/><name val=\"Calibri\"/></font>"
  "</fonts>"
  "<fills count=\"3\">"
  "<fill><patternFill patternType=\"none\"/></fill>"
  "<fill><patternFill patternType=\"gray125\"/></fill>"
  "<fill><patternFill patternType=\"solid\"><fgColor rgb=\"FFE0E0E0\"/><bgColor rgb=\"FFE0E0E0\"/></patternFill></fill>"
  "</fills>"
  "<borders count=\"2\">"
  "<border><left/><right/><top/><bottom/><diagonal/></border>"
  "<border><left style=\"thin\"/><right style=\"thin\"/><top style=\"thin\"/><bottom style=\"thin\"/><diagonal/></border>"
  "</borders>"
  "<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>"
  "<cellXfs count=\"4\">"
  "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\"/>"
  "<xf numFmtId=\"0\" fontId=\"1\" fillId=\"2\" borderId=\"1\" xfId=\"0\" applyFont=\"1\" applyFill=\"1\" applyBorder=\"1\" applyAlignment=\"1\">"
  "<alignment horizontal=\"center\" vertical=\"center\"/></xf>"
  "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"1\" xfId=\"0\" applyBorder=\"1\"/>"
  "<xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"1\" xfId=\"0\" applyBorder=\"1\" applyAlignment=\"1\">"
  "<alignment horizontal=\"right\"/></xf>"
  "</cellXfs>"
  "<cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>"
  "</styleSheet>";

const char* kContentTypesXml =
  "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
  "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
  "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
  "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
  "<Override PartName=\"/xl/workbook.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
  "<Override PartName=\"/xl/worksheets/sheet1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>"
  "<Override PartName=\"/xl/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml\"/>"
  "</Types>";

const char* kRootRelsXml =
  "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
  "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
  "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"xl/workbook.xml\"/>"
  "</Relationships>";

const char* kWorkbookXml =
  "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
  "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
  "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
  "<sheets><sheet name=\"Data\" sheetId=\"1\" r:id=\"rId1\"/></sheets>"
  "</workbook>";

const char* kWorkbookRelsXml =
  "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
  "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
  "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/sheet1.xml\"/>"
  "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>"
  "</Relationships>";

} // namespace

double xlsxColumnWidth(size_t longest) {
  return std::min((static_cast<double>(longest) + 2.0) * 1.2, 50.0);
}

void writeXlsx(const Table& table, const fs::path& path, bool styled) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }
  ZipWriter zip(path);
  zip.add("[Content_Types].xml", kContentTypesXml);
  zip.add("_rels/.rels", kRootRelsXml);
  zip.add("xl/workbook.xml", kWorkbookXml);
  zip.add("xl/_rels/workbook.xml.rels", kWorkbookRelsXml);
  zip.add("xl/styles.xml", kStylesXml);
  zip.add("xl/worksheets/sheet1.xml", sheetXml(table, styled));
  zip.close();
}
