#include "session_codec.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

const Json::Value& require(const Json::Value& json, const char* key) {
  if (!json.isObject() || !json.isMember(key)) {
    throw std::runtime_error(std::string("missing field '") + key + "'");
  }
  return json[key];
}

std::string requireString(const Json::Value& json, const char* key) {
  const Json::Value& v = require(json, key);
  if (!v.isString()) throw std::runtime_error(std::string("field '") + key + "' is not a string");
  return v.asString();
}

int optionalInt(const Json::Value& json, const char* key, int fallback) {
  if (!json.isMember(key) || json[key].isNull()) return fallback;
  if (!json[key].isNumeric()) throw std::runtime_error(std::string("field '") + key + "' is not a number");
  return json[key].asInt();
}

Json::Value rowsToJson(const std::vector<std::vector<CellValue>>& rows, const std::vector<std::string>& columns) {
  Json::Value out(Json::arrayValue);
  for (const auto& row : rows) {
    Json::Value record(Json::objectValue);
    for (size_t c = 0; c < columns.size() && c < row.size(); ++c) {
      record[columns[c]] = cellToJson(row[c]);
    }
    out.append(record);
  }
  return out;
}

std::vector<std::vector<CellValue>> rowsFromJson(const Json::Value& json, const std::vector<std::string>& columns) {
  std::vector<std::vector<CellValue>> rows;
  if (!json.isArray()) return rows;
  for (const auto& record : json) {
    std::vector<CellValue> row;
    row.reserve(columns.size());
    for (const auto& name : columns) {
      row.push_back(record.isMember(name) ? cellFromJson(record[name]) : CellValue(std::string()));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

Json::Value gridToJson(const Grid& grid) {
  Json::Value out(Json::arrayValue);
  for (const auto& row : grid) {
    Json::Value cells(Json::arrayValue);
    for (const auto& cell : row) cells.append(cell);
    out.append(cells);
  }
  return out;
}

Grid gridFromJson(const Json::Value& json) {
  Grid grid;
  for (const auto& row : json) {
    std::vector<std::string> cells;
    for (const auto& cell : row) cells.push_back(cell.asString());
    grid.push_back(std::move(cells));
  }
  return grid;
}

Json::Value candidateListToJson(const std::vector<CandidateTable>& list) {
  Json::Value out(Json::arrayValue);
  for (const auto& c : list) {
    Json::Value entry(Json::objectValue);
    entry["first_page"] = c.firstPage;
    entry["last_page"] = c.lastPage;
    entry["rows"] = gridToJson(c.rows);
    out.append(entry);
  }
  return out;
}

std::vector<CandidateTable> candidateListFromJson(const Json::Value& json) {
  std::vector<CandidateTable> list;
  if (!json.isArray()) return list;
  for (const auto& entry : json) {
    CandidateTable c;
    c.firstPage = optionalInt(entry, "first_page", 0);
    c.lastPage = optionalInt(entry, "last_page", c.firstPage);
    c.rows = gridFromJson(require(entry, "rows"));
    list.push_back(std::move(c));
  }
  return list;
}

} // namespace

Json::Value cellToJson(const CellValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) return Json::Value(*s);
  if (const auto* i = std::get_if<long long>(&value)) return Json::Value(static_cast<Json::Int64>(*i));
  return Json::Value(std::get<double>(value));
}

CellValue cellFromJson(const Json::Value& json) {
  switch (json.type()) {
    case Json::intValue: return static_cast<long long>(json.asInt64());
    case Json::uintValue: return static_cast<long long>(json.asUInt64());
    case Json::realValue: return json.asDouble();
    case Json::nullValue: return std::string();
    default: return json.asString();
  }
}

Json::Value analysisToJson(const AnalysisResult& analysis) {
  Json::Value out(Json::objectValue);
  out["page_count"] = analysis.pageCount;
  out["has_tables"] = analysis.hasTables;
  out["has_images"] = analysis.hasImages;
  out["has_rtl_text"] = analysis.hasRtlText;
  out["suggested_strategy"] = toString(analysis.suggestedStrategy);
  return out;
}

AnalysisResult analysisFromJson(const Json::Value& json) {
  AnalysisResult a;
  a.pageCount = optionalInt(json, "page_count", 0);
  a.hasTables = json.get("has_tables", false).asBool();
  a.hasImages = json.get("has_images", false).asBool();
  a.hasRtlText = json.get("has_rtl_text", false).asBool();
  auto strategy = parseExtractionStrategy(json.get("suggested_strategy", "plain-text").asString());
  if (!strategy) throw std::runtime_error("unknown suggested_strategy");
  a.suggestedStrategy = *strategy;
  return a;
}

Json::Value sessionToJson(const Session& session) {
  Json::Value out(Json::objectValue);
  out["session_id"] = session.id;
  out["filename"] = session.filename;
  out["created_at"] = session.createdAt;
  out["status"] = toString(session.status());
  out["progress"] = session.progress;
  out["current_page"] = session.currentPage;
  out["total_pages"] = session.totalPages;
  out["output_format"] = session.outputFormat ? Json::Value(toString(*session.outputFormat)) : Json::Value();
  out["output_path"] = Json::Value();
  if (session.analysis) out["analysis"] = analysisToJson(*session.analysis);

  if (const auto* done = std::get_if<CompletedState>(&session.state)) {
    out["output_path"] = done->outputPath.string();
    Json::Value columns(Json::arrayValue);
    for (const auto& c : done->columns) columns.append(c);
    out["columns"] = columns;
    out["preview"] = rowsToJson(done->preview, done->columns);
  } else if (const auto* failed = std::get_if<FailedState>(&session.state)) {
    out["error"] = failed->message;
  }
  return out;
}

Session sessionFromJson(const Json::Value& json) {
  Session s;
  s.id = requireString(json, "session_id");
  s.filename = requireString(json, "filename");
  s.createdAt = json.get("created_at", "").asString();
  s.progress = optionalInt(json, "progress", 0);
  s.currentPage = optionalInt(json, "current_page", 0);
  s.totalPages = optionalInt(json, "total_pages", 0);
  if (json.isMember("output_format") && json["output_format"].isString()) {
    s.outputFormat = parseOutputFormat(json["output_format"].asString());
  }
  if (json.isMember("analysis") && json["analysis"].isObject()) {
    s.analysis = analysisFromJson(json["analysis"]);
  }

  auto status = parseSessionStatus(requireString(json, "status"));
  if (!status) throw std::runtime_error("unknown status '" + json["status"].asString() + "'");

  switch (*status) {
    case SessionStatus::Pending: s.state = PendingState{}; break;
    case SessionStatus::Analyzing: s.state = AnalyzingState{}; break;
    case SessionStatus::Processing: s.state = ProcessingState{}; break;
    case SessionStatus::Paused: s.state = PausedState{}; break;
    case SessionStatus::Completed: {
      CompletedState done;
      done.outputPath = requireString(json, "output_path");
      for (const auto& c : json.get("columns", Json::Value(Json::arrayValue))) {
        done.columns.push_back(c.asString());
      }
      done.preview = rowsFromJson(json.get("preview", Json::Value(Json::arrayValue)), done.columns);
      s.state = std::move(done);
      break;
    }
    case SessionStatus::Error:
      s.state = FailedState{json.get("error", "").asString()};
      break;
  }

  if (s.progress < 0 || s.progress > 100 || s.currentPage < 0 || s.currentPage > s.totalPages) {
    throw std::runtime_error("inconsistent progress fields");
  }
  return s;
}

Json::Value progressToJson(const ProgressInfo& info) {
  Json::Value out(Json::objectValue);
  out["status"] = toString(info.status);
  out["progress"] = info.progress;
  out["current_page"] = info.currentPage;
  out["total_pages"] = info.totalPages;
  out["error"] = info.error ? Json::Value(*info.error) : Json::Value();
  if (info.columns && info.preview) {
    Json::Value columns(Json::arrayValue);
    for (const auto& c : *info.columns) columns.append(c);
    out["columns"] = columns;
    out["preview"] = rowsToJson(*info.preview, *info.columns);
  }
  if (info.analysis) out["analysis"] = analysisToJson(*info.analysis);
  return out;
}

Json::Value checkpointToJson(const PageCheckpoint& checkpoint) {
  Json::Value out(Json::objectValue);
  out["next_page"] = checkpoint.nextPage;
  out["structured"] = candidateListToJson(checkpoint.candidates.structured);
  out["geometry"] = candidateListToJson(checkpoint.candidates.geometry);
  out["plain_text"] = candidateListToJson(checkpoint.candidates.plainText);
  return out;
}

PageCheckpoint checkpointFromJson(const Json::Value& json) {
  PageCheckpoint checkpoint;
  checkpoint.nextPage = optionalInt(json, "next_page", 0);
  checkpoint.candidates.structured = candidateListFromJson(json.get("structured", Json::Value()));
  checkpoint.candidates.geometry = candidateListFromJson(json.get("geometry", Json::Value()));
  checkpoint.candidates.plainText = candidateListFromJson(json.get("plain_text", Json::Value()));
  return checkpoint;
}

Json::Value parseJson(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw std::runtime_error("invalid JSON: " + errors);
  }
  return root;
}

std::string writeJson(const Json::Value& value, bool pretty) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "  " : "";
  return Json::writeString(builder, value);
}
