#pragma once

#include "session.hpp"
#include "session_codec.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Durable store of one Session record (plus the latest page checkpoint) per job.
// Each call is atomic on its own; there is no compare-and-swap, so two writers
// of the same record race with last-writer-wins semantics. ConversionService
// serializes its own writers per session; writers in other processes sharing the
// same store are not coordinated.
class SessionRepository {
public:
  virtual ~SessionRepository() = default;

  virtual std::optional<Session> get(const std::string& id) const = 0;
  virtual void put(const Session& session) = 0;
  // Unreadable records are skipped.
  virtual std::vector<Session> list() const = 0;

  virtual std::optional<PageCheckpoint> loadCheckpoint(const std::string& id) const = 0;
  virtual void saveCheckpoint(const std::string& id, const PageCheckpoint& checkpoint) = 0;
  virtual void clearCheckpoint(const std::string& id) = 0;
};

// One JSON file per session in a directory: <dir>/<id>.json, with checkpoints in
// <dir>/checkpoints/<id>.json. Writes go to a temporary file that is renamed over
// the record.
class FileSessionRepository : public SessionRepository {
public:
  explicit FileSessionRepository(std::filesystem::path dir);

  std::optional<Session> get(const std::string& id) const override;
  void put(const Session& session) override;
  std::vector<Session> list() const override;

  std::optional<PageCheckpoint> loadCheckpoint(const std::string& id) const override;
  void saveCheckpoint(const std::string& id, const PageCheckpoint& checkpoint) override;
  void clearCheckpoint(const std::string& id) override;

private:
  std::filesystem::path recordPath(const std::string& id) const;
  std::filesystem::path checkpointPath(const std::string& id) const;

  std::filesystem::path dir_;
};

class InMemorySessionRepository : public SessionRepository {
public:
  std::optional<Session> get(const std::string& id) const override;
  void put(const Session& session) override;
  std::vector<Session> list() const override;

  std::optional<PageCheckpoint> loadCheckpoint(const std::string& id) const override;
  void saveCheckpoint(const std::string& id, const PageCheckpoint& checkpoint) override;
  void clearCheckpoint(const std::string& id) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
  std::map<std::string, PageCheckpoint> checkpoints_;
};

// True for canonical lowercase UUID strings, the only ids the service issues.
bool isValidSessionId(const std::string& id);
std::string generateSessionId();
