#pragma once

#include "document_model.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Page-level access to a document's content. Page indices are 0-based.
// Implementations throw ExtractionFailure when the underlying engine fails.
class DocumentSource {
public:
  virtual ~DocumentSource() = default;

  virtual int pageCount() = 0;
  // One fragment per text line, as laid out by the extraction engine.
  virtual std::vector<TextFragment> lineFragments(int page) = 0;
  // One fragment per word.
  virtual std::vector<TextFragment> wordFragments(int page) = 0;
  virtual std::string plainText(int page) = 0;
  virtual bool hasImages(int page) = 0;
};

using DocumentSourceFactory =
  std::function<std::unique_ptr<DocumentSource>(const std::filesystem::path&)>;

// Reads PDFs through the poppler-utils command line tools (pdfinfo, pdftotext,
// pdfimages), which must be on PATH.
class PopplerDocumentSource : public DocumentSource {
public:
  explicit PopplerDocumentSource(std::filesystem::path pdfPath);

  int pageCount() override;
  std::vector<TextFragment> lineFragments(int page) override;
  std::vector<TextFragment> wordFragments(int page) override;
  std::string plainText(int page) override;
  bool hasImages(int page) override;

private:
  const std::string& bboxLayout(int page);

  std::filesystem::path pdfPath_;
  int pageCount_ = -1;
  int cachedPage_ = -1;
  std::string cachedLayout_;
};

DocumentSourceFactory popplerSourceFactory();

// Parses `pdftotext -bbox-layout` output. Each <line> becomes one fragment whose
// text is its words joined by spaces; each <word> becomes one word fragment.
// Either output may be null.
void parseBboxLayout(const std::string& xhtml,
                     std::vector<TextFragment>* lines,
                     std::vector<TextFragment>* words);

// Page count from `pdfinfo` output ("Pages:  N"); -1 if absent.
int parsePdfinfoPageCount(const std::string& pdfinfoOutput);

// Shell helpers shared by the poppler and tesseract collaborators.
bool commandExists(const std::string& command);
std::string shellQuote(const std::string& arg);
// Runs a shell command and returns its stdout. Throws ExtractionFailure when the
// command cannot be started or exits non-zero.
std::string runCommand(const std::string& cmd);
