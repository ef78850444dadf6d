#include <catch2/catch_all.hpp>

#include "table_assembler.hpp"

TEST_CASE("structured tables win over every other source", "[assembler]") {
  TableAssembler assembler(PipelineOptions{});
  assembler.addGeometryGrid(0, {{"G1", "G2"}, {"g", "1"}, {"h", "2"}, {"i", "3"}});
  assembler.addTextTable(1, {{"T1", "T2"}, {"t", "1"}});
  assembler.addStructuredTable(2, {{"S1", "S2"}, {"s", "9"}});

  Table table = assembler.assemble();
  REQUIRE(table.columns == std::vector<std::string>{"S1", "S2"});
  REQUIRE(table.rows.size() == 1);
}

TEST_CASE("geometry tables win over plain-text tables", "[assembler]") {
  TableAssembler assembler(PipelineOptions{});
  assembler.addTextTable(0, {{"T1", "T2"}, {"t", "1"}, {"u", "2"}, {"v", "3"}});
  assembler.addGeometryGrid(1, {{"G1", "G2"}, {"g", "1"}});

  Table table = assembler.assemble();
  REQUIRE(table.columns == std::vector<std::string>{"G1", "G2"});
}

TEST_CASE("single-column candidates never reach the output", "[assembler]") {
  SECTION("the only candidate is one column wide") {
    TableAssembler assembler(PipelineOptions{});
    assembler.addTextTable(0, {{"Notes"}, {"one"}, {"two"}});
    REQUIRE(assembler.assemble().empty());
  }

  SECTION("a wider candidate of the same source is used instead") {
    TableAssembler assembler(PipelineOptions{});
    assembler.addTextTable(0, {{"Notes"}, {"one"}, {"two"}, {"three"}, {"four"}});
    assembler.addTextTable(1, {{"K", "V"}, {"a", "1"}});
    Table table = assembler.assemble();
    REQUIRE(table.columnCount() == 2);
    REQUIRE(table.rows.size() == 1);
  }
}

TEST_CASE("the largest candidate is primary and same-width ones are appended", "[assembler]") {
  TableAssembler assembler(PipelineOptions{});
  assembler.addTextTable(0, {{"A", "B"}, {"a1", "1"}});
  assembler.addTextTable(1, {{"X", "Y"}, {"x1", "1"}, {"x2", "2"}, {"x3", "3"}});
  assembler.addTextTable(2, {{"P", "Q", "R"}, {"p", "q", "r"}});

  Table table = assembler.assemble();
  REQUIRE(table.columns == std::vector<std::string>{"X", "Y"});
  REQUIRE(table.rows.size() == 4);
  REQUIRE(std::get<std::string>(table.rows[3][0]) == "a1");
  REQUIRE(std::get<long long>(table.rows[3][1]) == 1);
}

TEST_CASE("consecutive geometry pages extend one candidate", "[assembler]") {
  TableAssembler assembler(PipelineOptions{});
  assembler.addGeometryGrid(0, {{"Name", "Qty"}, {"a", "1"}});
  assembler.addGeometryGrid(1, {{"Name", "Qty"}, {"b", "2"}, {"c", "3"}});
  assembler.addGeometryGrid(2, {{"d", "4"}});

  REQUIRE(assembler.candidates().geometry.size() == 1);
  REQUIRE(assembler.candidates().geometry[0].firstPage == 0);
  REQUIRE(assembler.candidates().geometry[0].lastPage == 2);

  Table table = assembler.assemble();
  REQUIRE(table.columns == std::vector<std::string>{"Name", "Qty"});
  REQUIRE(table.rows.size() == 4);

  SECTION("a different width starts a new candidate") {
    assembler.addGeometryGrid(3, {{"x", "y", "z"}, {"1", "2", "3"}});
    REQUIRE(assembler.candidates().geometry.size() == 2);
  }

  SECTION("a page gap starts a new candidate") {
    assembler.addGeometryGrid(4, {{"Name", "Qty"}, {"e", "5"}});
    REQUIRE(assembler.candidates().geometry.size() == 2);
    REQUIRE(assembler.candidates().geometry[0].lastPage == 2);
    REQUIRE(assembler.candidates().geometry[1].firstPage == 4);
    REQUIRE(assembler.candidates().geometry[1].rows.size() == 2);
  }
}

TEST_CASE("an assembler seeded from a checkpoint continues where it stopped", "[assembler]") {
  TableAssembler first(PipelineOptions{});
  first.addGeometryGrid(0, {{"Name", "Qty"}, {"a", "1"}});

  TableAssembler resumed(PipelineOptions{}, first.candidates());
  resumed.addGeometryGrid(1, {{"Name", "Qty"}, {"b", "2"}});

  Table table = resumed.assemble();
  REQUIRE(table.rows.size() == 2);
}
