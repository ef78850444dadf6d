#pragma once

#include "document_model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class SessionStatus {
  Pending,
  Analyzing,
  Processing,
  Paused,
  Completed,
  Error
};

enum class OutputFormat {
  Csv,
  Xlsx
};

enum class ExtractionStrategy {
  Structured,
  RtlOptimized,
  Ocr,
  PlainText
};

// Document-wide verdict of the strategy selector; computed once per session.
struct AnalysisResult {
  int pageCount = 0;
  bool hasTables = false;
  bool hasImages = false;
  bool hasRtlText = false;
  ExtractionStrategy suggestedStrategy = ExtractionStrategy::PlainText;
};

struct PendingState {};
struct AnalyzingState {};
struct ProcessingState {};
struct PausedState {};

struct CompletedState {
  std::filesystem::path outputPath;
  std::vector<std::string> columns;
  std::vector<std::vector<CellValue>> preview;
};

struct FailedState {
  std::string message;
};

// Output and error fields only exist in the state that owns them. The
// alternative order matches SessionStatus.
using SessionState = std::variant<PendingState, AnalyzingState, ProcessingState,
                                  PausedState, CompletedState, FailedState>;

struct Session {
  std::string id;
  std::string filename;
  std::string createdAt;
  SessionState state;
  int progress = 0;
  int currentPage = 0;
  int totalPages = 0;
  std::optional<OutputFormat> outputFormat;
  std::optional<AnalysisResult> analysis;

  SessionStatus status() const { return static_cast<SessionStatus>(state.index()); }
};

// Snapshot returned by the progress query.
struct ProgressInfo {
  SessionStatus status = SessionStatus::Pending;
  int progress = 0;
  int currentPage = 0;
  int totalPages = 0;
  std::optional<std::string> error;
  std::optional<std::vector<std::string>> columns;
  std::optional<std::vector<std::vector<CellValue>>> preview;
  std::optional<AnalysisResult> analysis;
};

ProgressInfo progressOf(const Session& session);

// floor(current / total * 100), clamped to 0..100; 0 when total is 0.
int computeProgress(int currentPage, int totalPages);

std::string toString(SessionStatus status);
std::string toString(OutputFormat format);
std::string toString(ExtractionStrategy strategy);

// Accepts "csv", "xlsx" and "spreadsheet". Throws ValidationError otherwise.
OutputFormat parseOutputFormat(const std::string& name);
std::optional<SessionStatus> parseSessionStatus(const std::string& name);
std::optional<ExtractionStrategy> parseExtractionStrategy(const std::string& name);
