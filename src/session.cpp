#include "session.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

ProgressInfo progressOf(const Session& session) {
  ProgressInfo info;
  info.status = session.status();
  info.progress = session.progress;
  info.currentPage = session.currentPage;
  info.totalPages = session.totalPages;
  info.analysis = session.analysis;
  if (const auto* failed = std::get_if<FailedState>(&session.state)) {
    info.error = failed->message;
  }
  if (const auto* done = std::get_if<CompletedState>(&session.state)) {
    info.columns = done->columns;
    info.preview = done->preview;
  }
  return info;
}

int computeProgress(int currentPage, int totalPages) {
  if (totalPages <= 0) return 0;
  long long pct = static_cast<long long>(currentPage) * 100 / totalPages;
  return static_cast<int>(std::clamp(pct, 0LL, 100LL));
}

std::string toString(SessionStatus status) {
  switch (status) {
    case SessionStatus::Pending: return "pending";
    case SessionStatus::Analyzing: return "analysis";
    case SessionStatus::Processing: return "processing";
    case SessionStatus::Paused: return "paused";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::Error: return "error";
  }
  return "unknown";
}

std::string toString(OutputFormat format) {
  return format == OutputFormat::Csv ? "csv" : "xlsx";
}

std::string toString(ExtractionStrategy strategy) {
  switch (strategy) {
    case ExtractionStrategy::Structured: return "structured";
    case ExtractionStrategy::RtlOptimized: return "rtl-optimized";
    case ExtractionStrategy::Ocr: return "ocr";
    case ExtractionStrategy::PlainText: return "plain-text";
  }
  return "plain-text";
}

OutputFormat parseOutputFormat(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "csv") return OutputFormat::Csv;
  if (lower == "xlsx" || lower == "spreadsheet") return OutputFormat::Xlsx;
  throw ValidationError("Invalid output format '" + name + "'. Use 'csv' or 'xlsx'");
}

std::optional<SessionStatus> parseSessionStatus(const std::string& name) {
  for (auto s : {SessionStatus::Pending, SessionStatus::Analyzing, SessionStatus::Processing,
                 SessionStatus::Paused, SessionStatus::Completed, SessionStatus::Error}) {
    if (toString(s) == name) return s;
  }
  return std::nullopt;
}

std::optional<ExtractionStrategy> parseExtractionStrategy(const std::string& name) {
  for (auto s : {ExtractionStrategy::Structured, ExtractionStrategy::RtlOptimized,
                 ExtractionStrategy::Ocr, ExtractionStrategy::PlainText}) {
    if (toString(s) == name) return s;
  }
  return std::nullopt;
}
