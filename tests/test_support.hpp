#pragma once

#include "document_source.hpp"
#include "errors.hpp"
#include "session_repository.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Scripted document: per-page line fragments, word fragments and text, plus call
// counters shared across every source created from the same script.
struct FakeDocument {
  struct Page {
    std::vector<TextFragment> lines;
    std::vector<TextFragment> words;
    std::string text;
    bool images = false;
  };

  std::vector<Page> pages;
  std::map<int, int> lineVisits;
  int wordCalls = 0;
  int textCalls = 0;
  int imageCalls = 0;
  // Called on the worker thread before a page's line fragments are returned.
  std::function<void(int)> onPage;
  // Called before a page's word fragments are returned.
  std::function<void(int)> onWords;
  // Page whose line extraction throws ExtractionFailure; -1 for none.
  int failingPage = -1;
};

class FakeDocumentSource : public DocumentSource {
public:
  explicit FakeDocumentSource(std::shared_ptr<FakeDocument> doc) : doc_(std::move(doc)) {}

  int pageCount() override { return static_cast<int>(doc_->pages.size()); }

  std::vector<TextFragment> lineFragments(int page) override {
    doc_->lineVisits[page]++;
    if (doc_->onPage) doc_->onPage(page);
    if (page == doc_->failingPage) throw ExtractionFailure("unreadable page " + std::to_string(page + 1));
    return doc_->pages.at(page).lines;
  }

  std::vector<TextFragment> wordFragments(int page) override {
    doc_->wordCalls++;
    if (doc_->onWords) doc_->onWords(page);
    return doc_->pages.at(page).words;
  }

  std::string plainText(int page) override {
    doc_->textCalls++;
    return doc_->pages.at(page).text;
  }

  bool hasImages(int page) override {
    doc_->imageCalls++;
    return doc_->pages.at(page).images;
  }

private:
  std::shared_ptr<FakeDocument> doc_;
};

inline DocumentSourceFactory fakeSourceFactory(std::shared_ptr<FakeDocument> doc) {
  return [doc](const std::filesystem::path&) { return std::make_unique<FakeDocumentSource>(doc); };
}

inline TextFragment fragment(const std::string& text, double left, double top,
                             double width = 40.0, double height = 10.0) {
  return TextFragment{text, left, top, left + width, top + height};
}

// Two-column page: a header line followed by `rows` data lines, 30 units apart.
inline FakeDocument::Page twoColumnPage(const std::vector<std::pair<std::string, std::string>>& rows,
                                        bool withHeader = true) {
  FakeDocument::Page page;
  double top = 100.0;
  if (withHeader) {
    page.lines.push_back(fragment("Product", 50, top));
    page.lines.push_back(fragment("Qty", 300, top));
    top += 30.0;
  }
  for (const auto& row : rows) {
    page.lines.push_back(fragment(row.first, 50, top));
    page.lines.push_back(fragment(row.second, 300, top));
    top += 30.0;
  }
  return page;
}

// Removes a scratch directory on scope exit.
class ScratchDir {
public:
  ScratchDir()
    : path_(std::filesystem::temp_directory_path() / ("pdftabulate_test_" + generateSessionId())) {
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};
