#pragma once

#include "config.hpp"
#include "document_source.hpp"
#include "ocr_engine.hpp"
#include "progress_reporter.hpp"
#include "session.hpp"
#include "session_repository.hpp"
#include "table_assembler.hpp"

#include <filesystem>
#include <mutex>
#include <string>

// Everything one background run of a session needs. References must outlive
// the run.
struct JobContext {
  std::string sessionId;
  std::filesystem::path documentPath;
  std::filesystem::path outputDir;
  SessionRepository& repository;
  std::mutex& sessionMutex;
  const RunControl& control;
  const DocumentSourceFactory& sourceFactory;
  OcrEngine* ocr;
  PipelineOptions options;
};

// Extracts one page into the assembler following the run's strategy:
// structured extraction first for the structured and rtl-optimized strategies,
// then layout clustering plus row merging, and finally pattern detection over
// the plain text (with OCR text appended for sparse pages that carry images).
void processPage(DocumentSource& source, OcrEngine* ocr, const std::filesystem::path& document,
                 int page, ExtractionStrategy strategy, const PipelineOptions& options,
                 TableAssembler& assembler);

// Runs (or continues) a session whose status is Analyzing or Processing until
// it completes, fails, or is stopped at a checkpoint. Never throws; failures
// move the session to Error.
void runConversionJob(const JobContext& ctx);
