#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

const char* envOrNull(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

bool parseDouble(const std::string& key, const std::string& value, double& out, std::string& error) {
  try {
    size_t used = 0;
    double parsed = std::stod(value, &used);
    if (used != value.size() || parsed < 0.0) throw std::invalid_argument(value);
    out = parsed;
    return true;
  } catch (const std::exception&) {
    error = "Invalid number for " + key + ": " + value;
    return false;
  }
}

bool parseSize(const std::string& key, const std::string& value, std::uintmax_t& out, std::string& error) {
  try {
    size_t used = 0;
    unsigned long long parsed = std::stoull(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    out = static_cast<std::uintmax_t>(parsed);
    return true;
  } catch (const std::exception&) {
    error = "Invalid integer for " + key + ": " + value;
    return false;
  }
}

void requireOk(bool ok, const std::string& error) {
  if (!ok) throw std::runtime_error(error);
}

} // namespace

AppConfig loadConfigFromEnv() {
  AppConfig config;
  std::string error;

  if (const char* v = envOrNull("UPLOAD_FOLDER")) config.uploadDir = v;
  if (const char* v = envOrNull("TEMP_FOLDER")) config.stateDir = v;
  if (const char* v = envOrNull("MAX_UPLOAD_SIZE")) {
    requireOk(parseSize("MAX_UPLOAD_SIZE", v, config.maxUploadBytes, error), error);
  }
  if (const char* v = envOrNull("TESSERACT_CMD")) config.tesseractCommand = v;
  if (const char* v = envOrNull("TESSERACT_LANGS")) config.tesseractLanguages = v;
  if (const char* v = envOrNull("LOG_LEVEL")) config.logLevel = v;

  PipelineOptions& p = config.pipeline;
  if (const char* v = envOrNull("PDFTAB_ROW_TOLERANCE")) {
    requireOk(parseDouble("PDFTAB_ROW_TOLERANCE", v, p.rowTolerance, error), error);
  }
  if (const char* v = envOrNull("PDFTAB_COLUMN_TOLERANCE")) {
    requireOk(parseDouble("PDFTAB_COLUMN_TOLERANCE", v, p.columnTolerance, error), error);
  }
  if (const char* v = envOrNull("PDFTAB_GEOMETRY_NUMERIC_THRESHOLD")) {
    requireOk(parseDouble("PDFTAB_GEOMETRY_NUMERIC_THRESHOLD", v, p.geometryNumericThreshold, error), error);
  }
  if (const char* v = envOrNull("PDFTAB_STRUCTURED_NUMERIC_THRESHOLD")) {
    requireOk(parseDouble("PDFTAB_STRUCTURED_NUMERIC_THRESHOLD", v, p.structuredNumericThreshold, error), error);
  }
  return config;
}

bool applyConfigFlag(const std::string& arg, AppConfig& config, std::string& error) {
  auto valueOf = [&](const std::string& prefix, std::string& out) {
    if (arg.rfind(prefix, 0) != 0) return false;
    out = arg.substr(prefix.size());
    return true;
  };

  std::string value;
  if (valueOf("--upload-dir=", value)) {
    config.uploadDir = value;
  } else if (valueOf("--state-dir=", value)) {
    config.stateDir = value;
  } else if (valueOf("--log-level=", value)) {
    config.logLevel = value;
  } else if (valueOf("--max-upload-size=", value)) {
    return parseSize("--max-upload-size", value, config.maxUploadBytes, error);
  } else if (valueOf("--row-tolerance=", value)) {
    return parseDouble("--row-tolerance", value, config.pipeline.rowTolerance, error);
  } else if (valueOf("--column-tolerance=", value)) {
    return parseDouble("--column-tolerance", value, config.pipeline.columnTolerance, error);
  } else {
    return false;
  }
  return true;
}
