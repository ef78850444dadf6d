#pragma once

#include "config.hpp"
#include "document_model.hpp"

// Accumulates candidate tables page by page and reconciles them into the single
// output table of a run.
//
// Sources rank structured > geometry > plain text. assemble() only looks at the
// highest-ranked source that produced any candidate; lower sources are ignored
// for the whole document. Within that source, candidates narrower than two
// columns are discarded, the candidate with the largest rows x columns becomes
// the primary table and every other candidate with the same column count is
// appended beneath it by position.
class TableAssembler {
public:
  explicit TableAssembler(const PipelineOptions& options, CandidateTables initial = {});

  void addStructuredTable(int page, Grid grid);
  // A geometry grid on the page right after the last candidate's last page, and
  // of the same width, extends that candidate: its rows are appended, except
  // leading rows that repeat the candidate's header. Otherwise it starts a new
  // candidate.
  void addGeometryGrid(int page, Grid grid);
  void addTextTable(int page, Grid grid);

  const CandidateTables& candidates() const { return candidates_; }

  Table assemble() const;

private:
  Table assembleFrom(const std::vector<CandidateTable>& list, double numericThreshold) const;

  PipelineOptions options_;
  CandidateTables candidates_;
};
