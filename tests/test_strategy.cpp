#include <catch2/catch_all.hpp>

#include "strategy_selector.hpp"
#include "structured_extractor.hpp"
#include "test_support.hpp"

namespace {

// 3 x 2 grid of words, rows 30 units apart, columns 150 units apart.
std::vector<TextFragment> wordTable() {
  std::vector<TextFragment> words;
  const char* cells[3][2] = {{"Item", "Price"}, {"Pen", "3"}, {"Ink", "12"}};
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 2; ++c) {
      words.push_back(fragment(cells[r][c], 50.0 + c * 150.0, 100.0 + r * 30.0, 30.0, 10.0));
    }
  }
  return words;
}

} // namespace

TEST_CASE("chooseStrategy follows the fixed priority", "[strategy]") {
  REQUIRE(chooseStrategy(true, true, true) == ExtractionStrategy::Structured);
  REQUIRE(chooseStrategy(false, true, true) == ExtractionStrategy::RtlOptimized);
  REQUIRE(chooseStrategy(false, false, true) == ExtractionStrategy::Ocr);
  REQUIRE(chooseStrategy(false, false, false) == ExtractionStrategy::PlainText);
}

TEST_CASE("analyzeDocument samples only the first pages", "[strategy]") {
  auto doc = std::make_shared<FakeDocument>();
  doc->pages.resize(5);
  doc->pages[4].words = wordTable();
  doc->pages[4].images = true;
  doc->pages[1].images = true;
  FakeDocumentSource source(doc);

  AnalysisResult result = analyzeDocument(source, PipelineOptions{});
  REQUIRE(result.pageCount == 5);
  REQUIRE_FALSE(result.hasTables);
  REQUIRE(result.hasImages);
  REQUIRE_FALSE(result.hasRtlText);
  REQUIRE(result.suggestedStrategy == ExtractionStrategy::Ocr);
  REQUIRE(doc->textCalls == 3);
  REQUIRE(doc->wordCalls == 3);
}

TEST_CASE("analyzeDocument detects tables and RTL text", "[strategy]") {
  auto doc = std::make_shared<FakeDocument>();
  doc->pages.resize(2);
  doc->pages[0].text = "\xD7\xA9\xD7\x9C\xD7\x95\xD7\x9D";

  SECTION("RTL text without tables") {
    FakeDocumentSource source(doc);
    REQUIRE(analyzeDocument(source, PipelineOptions{}).suggestedStrategy == ExtractionStrategy::RtlOptimized);
  }

  SECTION("a structured table outranks RTL text") {
    doc->pages[1].words = wordTable();
    FakeDocumentSource source(doc);
    AnalysisResult result = analyzeDocument(source, PipelineOptions{});
    REQUIRE(result.hasTables);
    REQUIRE(result.hasRtlText);
    REQUIRE(result.suggestedStrategy == ExtractionStrategy::Structured);
  }
}

TEST_CASE("extractStructuredTable finds word grids", "[structured]") {
  auto grid = extractStructuredTable(wordTable());
  REQUIRE(grid);
  REQUIRE(grid->size() == 3);
  REQUIRE((*grid)[0] == std::vector<std::string>{"Item", "Price"});
  REQUIRE((*grid)[2] == std::vector<std::string>{"Ink", "12"});

  SECTION("a single line is not a table") {
    REQUIRE_FALSE(extractStructuredTable({fragment("Hello", 50, 100, 30), fragment("world", 200, 100, 30)}));
  }

  SECTION("prose with one word per line is not a table") {
    std::vector<TextFragment> words = {
      fragment("Dear", 50, 100, 30), fragment("Sir", 200, 130, 30), fragment("Regards", 50, 160, 30),
    };
    REQUIRE_FALSE(extractStructuredTable(words));
  }

  SECTION("skewed baselines share a line and neighbouring words share a cell") {
    std::vector<TextFragment> words = {
      fragment("Item", 50, 100, 30), fragment("Price", 200, 100, 30),
      fragment("3", 200, 128, 30), fragment("Blue", 50, 130, 30), fragment("pen", 85, 132, 30),
      fragment("Ink", 50, 160, 30), fragment("12", 200, 160, 30),
    };
    auto skewed = extractStructuredTable(words);
    REQUIRE(skewed);
    REQUIRE(skewed->size() == 3);
    REQUIRE((*skewed)[1] == std::vector<std::string>{"Blue pen", "3"});
  }

  SECTION("no words") {
    REQUIRE_FALSE(extractStructuredTable({}));
  }
}
