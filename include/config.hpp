#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

// Tunables of the table-reconstruction pipeline. The two numeric thresholds are
// deliberately separate: the structured extractor and the geometry/plain-text
// paths have always used different values.
struct PipelineOptions {
  // A fragment joins the current row when its top lies less than this far below
  // the row's running bottom edge.
  double rowTolerance = 10.0;
  // Maximum distance between a left edge and a column cluster's mean to join it;
  // also the slack allowed when assigning fragments to columns.
  double columnTolerance = 10.0;
  // A cluster becomes a column boundary when its size reaches
  // max(minColumnOccurrences, minColumnShare * fragment count).
  size_t minColumnOccurrences = 2;
  double minColumnShare = 0.10;

  // Fraction of non-blank cells that must parse as numbers for a column to be
  // converted to numeric.
  double geometryNumericThreshold = 0.5;
  double structuredNumericThreshold = 0.7;

  // Pages inspected by the strategy selector.
  int samplePages = 3;
  // Pages with less text than this get OCR text appended when they have images.
  size_t ocrMinTextLength = 50;
  size_t previewRows = 10;
};

struct AppConfig {
  std::filesystem::path uploadDir = "uploads";
  std::filesystem::path stateDir = "temp_files";
  std::uintmax_t maxUploadBytes = 10 * 1024 * 1024;
  std::string tesseractCommand = "tesseract";
  std::string tesseractLanguages = "eng+heb";
  std::string logLevel = "info";
  PipelineOptions pipeline;
};

// Defaults overridden by UPLOAD_FOLDER, TEMP_FOLDER, MAX_UPLOAD_SIZE,
// TESSERACT_CMD, TESSERACT_LANGS, LOG_LEVEL and the PDFTAB_* pipeline variables.
// Throws std::runtime_error on an unparsable numeric value.
AppConfig loadConfigFromEnv();

// Applies one "--key=value" flag. Returns false if the flag is not a config flag;
// sets error and returns false if it is one but its value is invalid.
bool applyConfigFlag(const std::string& arg, AppConfig& config, std::string& error);
