#include <catch2/catch_all.hpp>

#include "layout_clusterer.hpp"
#include "row_merger.hpp"
#include "test_support.hpp"

using Catch::Approx;

TEST_CASE("groupIntoRows joins fragments within the row tolerance", "[layout]") {
  std::vector<TextFragment> fragments = {
    fragment("b", 100, 12),
    fragment("a", 10, 10),
    fragment("c", 10, 40),
    fragment("d", 100, 45),
    fragment("e", 10, 80),
  };

  auto rows = groupIntoRows(fragments, 10.0);
  REQUIRE(rows.size() == 3);
  REQUIRE(rows[0].size() == 2);
  REQUIRE(rows[0][0].text == "a");
  REQUIRE(rows[0][1].text == "b");
  REQUIRE(rows[1][0].text == "c");
  REQUIRE(rows[1][1].text == "d");
  REQUIRE(rows[2].size() == 1);

  SECTION("a gap of exactly the tolerance starts a new row") {
    auto split = groupIntoRows({fragment("x", 0, 0), fragment("y", 0, 20)}, 10.0);
    REQUIRE(split.size() == 2);
  }

  SECTION("a fragment starting inside a tall row's band stays in that row") {
    // "y" starts 40 units above the running bottom of "x".
    auto tall = groupIntoRows({fragment("x", 0, 0, 40, 60), fragment("y", 100, 20)}, 10.0);
    REQUIRE(tall.size() == 1);
    REQUIRE(tall[0].size() == 2);
  }

  SECTION("no fragments give no rows") {
    REQUIRE(groupIntoRows({}, 10.0).empty());
  }
}

TEST_CASE("detectColumnBoundaries clusters nearby left edges", "[layout]") {
  std::vector<TextFragment> fragments;
  for (double x : {10.0, 11.0, 9.0, 50.0, 52.0}) fragments.push_back(fragment("v", x, 0));

  auto boundaries = detectColumnBoundaries(fragments, PipelineOptions{});
  REQUIRE(boundaries.size() == 2);
  REQUIRE(boundaries[0].center == Approx(10.0));
  REQUIRE(boundaries[0].count == 3);
  REQUIRE(boundaries[1].center == Approx(51.0));
  REQUIRE(boundaries[1].count == 2);
}

TEST_CASE("detectColumnBoundaries drops rare clusters", "[layout]") {
  std::vector<TextFragment> fragments;
  for (int i = 0; i < 30; ++i) fragments.push_back(fragment("v", 10.0 + (i % 3), i * 20.0));
  for (int i = 0; i < 2; ++i) fragments.push_back(fragment("w", 200.0, i * 20.0));

  // 32 fragments: a cluster needs at least floor(3.2) = 3 members.
  auto boundaries = detectColumnBoundaries(fragments, PipelineOptions{});
  REQUIRE(boundaries.size() == 1);
  REQUIRE(boundaries[0].center == Approx(11.0));
}

TEST_CASE("assignColumn picks the right-most reachable boundary", "[layout]") {
  std::vector<ColumnBoundary> boundaries = {{10.0, 3}, {51.0, 2}, {120.0, 4}};
  REQUIRE(assignColumn(0.0, boundaries, 10.0) == 0);
  REQUIRE(assignColumn(12.0, boundaries, 10.0) == 0);
  REQUIRE(assignColumn(41.0, boundaries, 10.0) == 1);
  REQUIRE(assignColumn(300.0, boundaries, 10.0) == 2);
  REQUIRE(assignColumn(5.0, {}, 10.0) == 0);
}

TEST_CASE("clusterLayout rebuilds a page grid", "[layout]") {
  auto page = twoColumnPage({{"Apples", "5"}, {"Pears", "7"}});
  page.lines.push_back(fragment("green", 95, 160));

  Grid grid = clusterLayout(page.lines, PipelineOptions{});
  REQUIRE(grid.size() == 3);
  REQUIRE(grid[0] == std::vector<std::string>{"Product", "Qty"});
  REQUIRE(grid[1] == std::vector<std::string>{"Apples", "5"});
  REQUIRE(grid[2] == std::vector<std::string>{"Pears green", "7"});

  SECTION("empty page") {
    REQUIRE(clusterLayout({}, PipelineOptions{}).empty());
  }

  SECTION("no surviving boundaries give a single column") {
    Grid single = clusterLayout({fragment("alone", 10, 10)}, PipelineOptions{});
    REQUIRE(single.size() == 1);
    REQUIRE(single[0].size() == 1);
  }
}

TEST_CASE("mergeContinuationRows folds wrapped rows", "[rowmerge]") {
  SECTION("second cell wraps onto the next line") {
    Grid merged = mergeContinuationRows({{"A", "B"}, {"", "C"}});
    REQUIRE(merged == Grid{{"A", "B C"}});
  }

  SECTION("blank cells above are filled in") {
    Grid merged = mergeContinuationRows({{"Item", "", "Total"}, {"", "", "note"}, {"Desk", "", ""}, {"", "", "9"}});
    REQUIRE(merged == Grid{{"Item", "", "Total note"}, {"Desk", "", "9"}});
  }

  SECTION("rows with a leading value are kept") {
    Grid rows = {{"A", "1"}, {"B", "2"}, {"C", ""}};
    REQUIRE(mergeContinuationRows(rows) == rows);
  }

  SECTION("a leading continuation row is retained") {
    Grid merged = mergeContinuationRows({{"", "x"}, {"A", "B"}});
    REQUIRE(merged.size() == 2);
  }

  SECTION("only one leading blank out of three cells is not a continuation") {
    REQUIRE_FALSE(isContinuationRow({"", "b", "c"}));
    REQUIRE(isContinuationRow({"", "", "c"}));
  }
}
