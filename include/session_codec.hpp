#pragma once

#include "document_model.hpp"
#include "session.hpp"

#include <json/json.h>

#include <string>

// JSON mapping of the persisted records. Field names follow the session files
// written by earlier releases (session_id, current_page, output_path, ...).
Json::Value sessionToJson(const Session& session);
// Throws std::runtime_error when a required field is missing or mistyped.
Session sessionFromJson(const Json::Value& json);

Json::Value analysisToJson(const AnalysisResult& analysis);
AnalysisResult analysisFromJson(const Json::Value& json);

Json::Value progressToJson(const ProgressInfo& info);

Json::Value cellToJson(const CellValue& value);
CellValue cellFromJson(const Json::Value& json);

struct PageCheckpoint {
  int nextPage = 0;
  CandidateTables candidates;
};

Json::Value checkpointToJson(const PageCheckpoint& checkpoint);
PageCheckpoint checkpointFromJson(const Json::Value& json);

// Throws std::runtime_error on malformed input.
Json::Value parseJson(const std::string& text);
std::string writeJson(const Json::Value& value, bool pretty = false);
