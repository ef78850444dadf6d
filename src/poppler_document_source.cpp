#include "document_source.hpp"
#include "errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace {

void appendUtf8(std::string& out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          char* end = nullptr;
          unsigned long code = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
          if (!digits.empty() && end && *end == '\0') appendUtf8(rep, code);
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

// Reads xMin/yMin/xMax/yMax from a tag's attribute text.
bool readBox(const std::string& attrs, TextFragment& f) {
  static const std::regex attrRe("(xMin|yMin|xMax|yMax)=\"([-0-9.eE+]+)\"");
  int seen = 0;
  for (std::sregex_iterator it(attrs.begin(), attrs.end(), attrRe), end; it != end; ++it) {
    const std::string name = (*it)[1].str();
    const double value = std::stod((*it)[2].str());
    if (name == "xMin") f.left = value;
    else if (name == "yMin") f.top = value;
    else if (name == "xMax") f.right = value;
    else f.bottom = value;
    ++seen;
  }
  return seen == 4;
}

// Finds the next <tag ...> at or after pos; fills attrs and returns the index just
// past '>', or npos.
size_t nextOpenTag(const std::string& s, const std::string& tag, size_t pos, std::string& attrs) {
  const std::string open = "<" + tag;
  while ((pos = s.find(open, pos)) != std::string::npos) {
    size_t after = pos + open.size();
    if (after < s.size() && (s[after] == ' ' || s[after] == '>')) {
      size_t close = s.find('>', after);
      if (close == std::string::npos) return std::string::npos;
      attrs = s.substr(after, close - after);
      return close + 1;
    }
    pos = after;
  }
  return std::string::npos;
}

} // namespace

void parseBboxLayout(const std::string& xhtml,
                     std::vector<TextFragment>* lines,
                     std::vector<TextFragment>* words) {
  size_t pos = 0;
  std::string attrs;
  while ((pos = nextOpenTag(xhtml, "line", pos, attrs)) != std::string::npos) {
    TextFragment line;
    bool lineHasBox = readBox(attrs, line);
    size_t lineEnd = xhtml.find("</line>", pos);
    if (lineEnd == std::string::npos) lineEnd = xhtml.size();

    std::string lineText;
    size_t wpos = pos;
    while ((wpos = nextOpenTag(xhtml, "word", wpos, attrs)) != std::string::npos && wpos < lineEnd) {
      size_t wordEnd = xhtml.find("</word>", wpos);
      if (wordEnd == std::string::npos || wordEnd > lineEnd) break;
      TextFragment word;
      bool wordHasBox = readBox(attrs, word);
      word.text = trim(decodeEntities(xhtml.substr(wpos, wordEnd - wpos)));
      wpos = wordEnd + 7;
      if (word.text.empty()) continue;
      if (!lineText.empty()) lineText += ' ';
      lineText += word.text;
      if (words && wordHasBox) words->push_back(std::move(word));
    }

    if (lines && lineHasBox && !lineText.empty()) {
      line.text = std::move(lineText);
      lines->push_back(std::move(line));
    }
    pos = lineEnd;
  }
}

int parsePdfinfoPageCount(const std::string& pdfinfoOutput) {
  static const std::regex pagesRe("(^|\\n)Pages:\\s+([0-9]+)");
  std::smatch m;
  if (std::regex_search(pdfinfoOutput, m, pagesRe)) return std::stoi(m[2].str());
  return -1;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out += "'";
  return out;
}

std::string runCommand(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw ExtractionFailure("Failed to run: " + cmd);
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw ExtractionFailure("Command failed (" + std::to_string(rc) + "): " + cmd);
  return out;
}

PopplerDocumentSource::PopplerDocumentSource(std::filesystem::path pdfPath)
  : pdfPath_(std::move(pdfPath)) {
  for (const char* tool : {"pdfinfo", "pdftotext", "pdfimages"}) {
    if (!commandExists(tool)) {
      throw ExtractionFailure(std::string(tool) + " not found; install poppler-utils");
    }
  }
}

int PopplerDocumentSource::pageCount() {
  if (pageCount_ < 0) {
    int pages = parsePdfinfoPageCount(runCommand("pdfinfo " + shellQuote(pdfPath_.string()) + " 2>/dev/null"));
    if (pages < 0) throw ExtractionFailure("pdfinfo reported no page count for " + pdfPath_.string());
    pageCount_ = pages;
  }
  return pageCount_;
}

const std::string& PopplerDocumentSource::bboxLayout(int page) {
  if (page != cachedPage_) {
    const std::string n = std::to_string(page + 1);
    cachedLayout_ = runCommand("pdftotext -bbox-layout -f " + n + " -l " + n + " -q " +
                               shellQuote(pdfPath_.string()) + " -");
    cachedPage_ = page;
  }
  return cachedLayout_;
}

std::vector<TextFragment> PopplerDocumentSource::lineFragments(int page) {
  std::vector<TextFragment> lines;
  parseBboxLayout(bboxLayout(page), &lines, nullptr);
  return lines;
}

std::vector<TextFragment> PopplerDocumentSource::wordFragments(int page) {
  std::vector<TextFragment> words;
  parseBboxLayout(bboxLayout(page), nullptr, &words);
  return words;
}

std::string PopplerDocumentSource::plainText(int page) {
  const std::string n = std::to_string(page + 1);
  return runCommand("pdftotext -layout -nopgbrk -f " + n + " -l " + n + " -q " +
                    shellQuote(pdfPath_.string()) + " -");
}

bool PopplerDocumentSource::hasImages(int page) {
  const std::string n = std::to_string(page + 1);
  std::string listing = runCommand("pdfimages -list -f " + n + " -l " + n + " " +
                                   shellQuote(pdfPath_.string()) + " 2>/dev/null");
  // Two header lines precede one line per image.
  std::istringstream in(listing);
  std::string line;
  int count = 0;
  while (std::getline(in, line)) {
    if (!isBlank(line)) ++count;
  }
  return count > 2;
}

DocumentSourceFactory popplerSourceFactory() {
  return [](const std::filesystem::path& path) -> std::unique_ptr<DocumentSource> {
    return std::make_unique<PopplerDocumentSource>(path);
  };
}
