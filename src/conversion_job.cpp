#include "conversion_job.hpp"
#include "errors.hpp"
#include "layout_clusterer.hpp"
#include "row_merger.hpp"
#include "strategy_selector.hpp"
#include "structured_extractor.hpp"
#include "table_writer.hpp"
#include "text_table_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fs = std::filesystem;

void processPage(DocumentSource& source, OcrEngine* ocr, const fs::path& document,
                 int page, ExtractionStrategy strategy, const PipelineOptions& options,
                 TableAssembler& assembler) {
  if (strategy == ExtractionStrategy::Structured || strategy == ExtractionStrategy::RtlOptimized) {
    if (auto grid = extractStructuredTable(source.wordFragments(page))) {
      spdlog::info("Found structured table on page {} with {} rows", page + 1, grid->size());
      assembler.addStructuredTable(page, std::move(*grid));
      return;
    }
  }

  Grid grid = clusterLayout(source.lineFragments(page), options);
  if (grid.size() >= 2 && gridColumnCount(grid) >= 2) {
    spdlog::info("Found layout table on page {} with {} rows", page + 1, grid.size());
    assembler.addGeometryGrid(page, mergeContinuationRows(grid));
    return;
  }

  std::string text = source.plainText(page);
  if (trim(text).size() < options.ocrMinTextLength || strategy == ExtractionStrategy::Ocr) {
    if (ocr && source.hasImages(page)) {
      try {
        text += "\n" + ocr->recognizePage(document, page);
      } catch (const std::exception& ex) {
        spdlog::error("OCR error on page {}: {}", page + 1, ex.what());
      }
    }
  }
  for (auto& table : detectTablesInText(preprocessPageText(text))) {
    assembler.addTextTable(page, std::move(table));
  }
}

namespace {

void runJob(const JobContext& ctx) {
  auto source = ctx.sourceFactory(ctx.documentPath);
  if (!source) throw ExtractionFailure("no document source for " + ctx.documentPath.string());
  const int totalPages = source->pageCount();

  std::optional<AnalysisResult> analysis;
  OutputFormat format = OutputFormat::Csv;
  {
    std::lock_guard<std::mutex> lock(ctx.sessionMutex);
    auto session = ctx.repository.get(ctx.sessionId);
    if (!session) return;
    analysis = session->analysis;
    format = session->outputFormat.value_or(OutputFormat::Csv);
  }
  if (!analysis) analysis = analyzeDocument(*source, ctx.options);

  int startPage = 0;
  CandidateTables restored;
  {
    std::lock_guard<std::mutex> lock(ctx.sessionMutex);
    auto session = ctx.repository.get(ctx.sessionId);
    if (!session) return;
    const SessionStatus status = session->status();
    if (status == SessionStatus::Analyzing) {
      ctx.repository.clearCheckpoint(ctx.sessionId);
    } else if (status == SessionStatus::Processing) {
      if (auto checkpoint = ctx.repository.loadCheckpoint(ctx.sessionId)) {
        startPage = checkpoint->nextPage;
        restored = std::move(checkpoint->candidates);
      } else {
        startPage = session->currentPage;
        if (startPage > 0) {
          spdlog::warn("Session {}: no checkpoint, resuming at page {} without earlier tables",
                       ctx.sessionId, startPage + 1);
        }
      }
    } else {
      spdlog::info("Session {}: status is {}, not running", ctx.sessionId, toString(status));
      return;
    }

    startPage = std::clamp(startPage, 0, totalPages);
    session->analysis = analysis;
    session->totalPages = totalPages;
    session->currentPage = startPage;
    session->progress = computeProgress(startPage, totalPages);
    if (ctx.control.stopRequested.load()) {
      session->state = PausedState{};
      ctx.repository.put(*session);
      spdlog::info("Session {}: stop requested after analysis, paused at page {}", ctx.sessionId,
                   startPage + 1);
      return;
    }
    session->state = ProcessingState{};
    ctx.repository.put(*session);
  }

  spdlog::info("Session {}: processing pages {}..{} with strategy {}", ctx.sessionId,
               startPage + 1, totalPages, toString(analysis->suggestedStrategy));

  TableAssembler assembler(ctx.options, std::move(restored));
  ProgressReporter reporter(ctx.repository, ctx.sessionMutex, ctx.control, ctx.sessionId);
  for (int page = startPage; page < totalPages; ++page) {
    processPage(*source, ctx.ocr, ctx.documentPath, page, analysis->suggestedStrategy, ctx.options, assembler);
    if (reporter.checkpoint(page + 1, totalPages, assembler.candidates()) == CheckpointDecision::Stop) {
      return;
    }
  }

  Table table = assembler.assemble();
  if (table.empty()) spdlog::warn("Session {}: no table data found", ctx.sessionId);

  const fs::path output = ctx.outputDir / (ctx.sessionId + "." + toString(format));
  writeArtifact(table, format, output);

  std::lock_guard<std::mutex> lock(ctx.sessionMutex);
  auto session = ctx.repository.get(ctx.sessionId);
  if (!session || session->status() != SessionStatus::Processing) {
    std::error_code ec;
    fs::remove(output, ec);
    return;
  }
  CompletedState done;
  done.outputPath = output;
  done.columns = table.columns;
  const size_t previewCount = std::min(ctx.options.previewRows, table.rows.size());
  done.preview.assign(table.rows.begin(), table.rows.begin() + previewCount);
  session->state = std::move(done);
  session->currentPage = totalPages;
  session->progress = 100;
  ctx.repository.put(*session);
  ctx.repository.clearCheckpoint(ctx.sessionId);
  spdlog::info("Session {}: completed with {} rows x {} columns", ctx.sessionId,
               table.rows.size(), table.columnCount());
}

} // namespace

void runConversionJob(const JobContext& ctx) {
  try {
    runJob(ctx);
  } catch (const std::exception& ex) {
    spdlog::error("Session {}: error processing document: {}", ctx.sessionId, ex.what());
    try {
      std::lock_guard<std::mutex> lock(ctx.sessionMutex);
      auto session = ctx.repository.get(ctx.sessionId);
      if (session && (session->status() == SessionStatus::Analyzing ||
                      session->status() == SessionStatus::Processing)) {
        session->state = FailedState{ex.what()};
        ctx.repository.put(*session);
      }
    } catch (const std::exception& inner) {
      spdlog::critical("Session {}: could not record failure: {}", ctx.sessionId, inner.what());
    }
  }
}
