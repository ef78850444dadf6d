#include <catch2/catch_all.hpp>

#include "document_source.hpp"
#include "errors.hpp"
#include "text_table_detector.hpp"

#include <string>

using Catch::Approx;

TEST_CASE("detectTablesInText splits on the first line's delimiter", "[text]") {
  SECTION("pipes") {
    auto tables = detectTablesInText("Name | Qty\nApple | 5\nPear | 7\n");
    REQUIRE(tables.size() == 1);
    REQUIRE(tables[0].size() == 3);
    REQUIRE(tables[0][1] == std::vector<std::string>{"Apple", "5"});
  }

  SECTION("semicolons win over commas") {
    auto tables = detectTablesInText("a;b,c\n1;2,3");
    REQUIRE(tables.size() == 1);
    REQUIRE(tables[0][0] == std::vector<std::string>{"a", "b,c"});
  }

  SECTION("runs of whitespace") {
    auto tables = detectTablesInText("Name  Qty  Price\nApple  5  1.20");
    REQUIRE(tables.size() == 1);
    REQUIRE(tables[0][0].size() == 3);
  }

  SECTION("blank lines separate tables") {
    auto tables = detectTablesInText("a|b\n1|2\n\nx;y;z\n1;2;3\n");
    REQUIRE(tables.size() == 2);
    REQUIRE(tables[1][0].size() == 3);
  }

  SECTION("inconsistent rows are not a table") {
    REQUIRE(detectTablesInText("a|b\n1|2|3").empty());
  }

  SECTION("prose is ignored") {
    REQUIRE(detectTablesInText("This is a sentence without any column breaks.\nAnother one").empty());
  }
}

TEST_CASE("preprocessPageText collapses wide gaps", "[text]") {
  REQUIRE(preprocessPageText("  Name      Qty\nApple\t\t\t5  \n") == "Name  Qty\nApple  5");
}

TEST_CASE("parseBboxLayout reads lines and words", "[poppler]") {
  const std::string xhtml =
    "<doc>\n"
    "  <page width=\"612.000000\" height=\"792.000000\">\n"
    "    <flow><block xMin=\"10\" yMin=\"20\" xMax=\"300\" yMax=\"60\">\n"
    "      <line xMin=\"10.5\" yMin=\"20.0\" xMax=\"100.0\" yMax=\"30.0\">\n"
    "        <word xMin=\"10.5\" yMin=\"20.0\" xMax=\"40.0\" yMax=\"30.0\">Fish</word>\n"
    "        <word xMin=\"45.0\" yMin=\"20.0\" xMax=\"100.0\" yMax=\"30.0\">&amp;&#x5E9;</word>\n"
    "      </line>\n"
    "      <line xMin=\"200\" yMin=\"50\" xMax=\"300\" yMax=\"60\">\n"
    "        <word xMin=\"200\" yMin=\"50\" xMax=\"300\" yMax=\"60\">Chips</word>\n"
    "      </line>\n"
    "    </block></flow>\n"
    "  </page>\n"
    "</doc>\n";

  std::vector<TextFragment> lines;
  std::vector<TextFragment> words;
  parseBboxLayout(xhtml, &lines, &words);

  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0].text == "Fish &\xD7\xA9");
  REQUIRE(lines[0].left == Approx(10.5));
  REQUIRE(lines[0].bottom == Approx(30.0));
  REQUIRE(lines[1].text == "Chips");
  REQUIRE(lines[1].left == Approx(200.0));

  REQUIRE(words.size() == 3);
  REQUIRE(words[1].text == "&\xD7\xA9");
  REQUIRE(words[1].right == Approx(100.0));

  std::vector<TextFragment> onlyLines;
  parseBboxLayout(xhtml, &onlyLines, nullptr);
  REQUIRE(onlyLines.size() == 2);
}

TEST_CASE("parsePdfinfoPageCount", "[poppler]") {
  REQUIRE(parsePdfinfoPageCount("Title:          Report\nPages:          12\nEncrypted:      no\n") == 12);
  REQUIRE(parsePdfinfoPageCount("Pages: 1") == 1);
  REQUIRE(parsePdfinfoPageCount("Syntax Error: garbage") == -1);
}

TEST_CASE("shellQuote escapes single quotes", "[poppler]") {
  REQUIRE(shellQuote("a b") == "'a b'");
  REQUIRE(shellQuote("it's") == "'it'\\''s'");
}

TEST_CASE("popplerSourceFactory builds a source or names the missing tools", "[poppler]") {
  auto factory = popplerSourceFactory();
  try {
    std::unique_ptr<DocumentSource> source = factory("missing.pdf");
    REQUIRE(source != nullptr);
  } catch (const ExtractionFailure& ex) {
    REQUIRE_THAT(ex.what(), Catch::Matchers::ContainsSubstring("poppler-utils"));
  }
}
