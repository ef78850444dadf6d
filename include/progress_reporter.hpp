#pragma once

#include "document_model.hpp"
#include "session_repository.hpp"

#include <atomic>
#include <mutex>
#include <string>

// Stop signal handed from the control side to a running job.
struct RunControl {
  std::atomic<bool> stopRequested{false};
};

enum class CheckpointDecision {
  Continue,
  Stop
};

// The single place where a running job persists its progress and where pause,
// cancel and shutdown take effect. Nothing interrupts a page in flight.
class ProgressReporter {
public:
  ProgressReporter(SessionRepository& repository, std::mutex& sessionMutex,
                   const RunControl& control, std::string sessionId);

  // Records that `pagesDone` of `totalPages` pages are finished, together with
  // the candidates accumulated so far, unless the session was reset meanwhile.
  // Returns Stop when the session is no longer Processing or a stop was
  // requested; a stop request on a Processing session also marks it Paused.
  CheckpointDecision checkpoint(int pagesDone, int totalPages, const CandidateTables& candidates);

private:
  SessionRepository& repository_;
  std::mutex& sessionMutex_;
  const RunControl& control_;
  std::string sessionId_;
};
