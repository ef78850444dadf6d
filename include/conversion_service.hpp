#pragma once

#include "config.hpp"
#include "document_source.hpp"
#include "ocr_engine.hpp"
#include "progress_reporter.hpp"
#include "session.hpp"
#include "session_repository.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct Artifact {
  std::string filename;
  std::string bytes;
};

// Session lifecycle: upload, start/pause/resume/cancel and the queries. Every
// operation on an unknown id throws NotFoundError, every operation the current
// status does not allow throws InvalidStateTransition.
//
// Each session gets at most one background worker. Control operations and the
// worker's checkpoints serialize their read-modify-write of the session record
// through a per-session mutex, so within one process a control operation cannot
// be overwritten by a worker write. Another process sharing the same repository
// is not covered by that mutex.
class ConversionService {
public:
  ConversionService(AppConfig config, std::unique_ptr<SessionRepository> repository,
                    DocumentSourceFactory sourceFactory, std::unique_ptr<OcrEngine> ocr);
  // Stops all workers at their next checkpoint; sessions still Processing are
  // left Paused.
  ~ConversionService();

  ConversionService(const ConversionService&) = delete;
  ConversionService& operator=(const ConversionService&) = delete;

  // Stores the document and creates a Pending session. Throws ValidationError for
  // a non-PDF filename, an empty upload or one over the size ceiling.
  std::string upload(const std::string& bytes, const std::string& filename);

  void start(const std::string& id, OutputFormat format);
  void pause(const std::string& id);
  void resume(const std::string& id);
  // Valid from any status.
  void cancel(const std::string& id);

  Session status(const std::string& id) const;
  ProgressInfo progress(const std::string& id) const;
  std::vector<Session> listSessions() const;
  Artifact download(const std::string& id) const;

  // Blocks until the session's current worker, if any, has exited.
  void wait(const std::string& id);

  std::filesystem::path documentPath(const std::string& id) const;
  std::filesystem::path outputDir() const;

  // Sessions whose worker control state is still held in memory.
  size_t trackedSessions() const;

private:
  struct Slot {
    std::mutex controlMutex; // start/resume/wait: owns `worker`
    std::mutex stateMutex;   // record read-modify-write, shared with the worker
    RunControl control;
    std::thread worker;
    std::atomic<bool> finished{false};
  };

  std::shared_ptr<Slot> slotFor(const std::string& id);
  // Joins finished workers and drops slots no caller holds. Needs slotsMutex_.
  void sweepIdleSlots();
  Session requireSession(const std::string& id) const;
  void launchWorker(Slot& slot, const std::string& id);
  static void joinWorker(Slot& slot);

  AppConfig config_;
  std::unique_ptr<SessionRepository> repository_;
  DocumentSourceFactory sourceFactory_;
  std::unique_ptr<OcrEngine> ocr_;

  mutable std::mutex slotsMutex_;
  std::map<std::string, std::shared_ptr<Slot>> slots_;
};
