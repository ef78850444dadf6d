#include "progress_reporter.hpp"

#include <spdlog/spdlog.h>

ProgressReporter::ProgressReporter(SessionRepository& repository, std::mutex& sessionMutex,
                                   const RunControl& control, std::string sessionId)
  : repository_(repository), sessionMutex_(sessionMutex), control_(control),
    sessionId_(std::move(sessionId)) {}

CheckpointDecision ProgressReporter::checkpoint(int pagesDone, int totalPages,
                                                const CandidateTables& candidates) {
  std::lock_guard<std::mutex> lock(sessionMutex_);
  auto session = repository_.get(sessionId_);
  if (!session) {
    spdlog::warn("Session {}: record vanished, stopping", sessionId_);
    return CheckpointDecision::Stop;
  }

  const SessionStatus status = session->status();
  if (status == SessionStatus::Processing || status == SessionStatus::Paused) {
    // Checkpoint first so the record never claims pages the checkpoint lacks.
    repository_.saveCheckpoint(sessionId_, PageCheckpoint{pagesDone, candidates});
    session->currentPage = pagesDone;
    session->totalPages = totalPages;
    session->progress = computeProgress(pagesDone, totalPages);
    repository_.put(*session);
  }

  if (status != SessionStatus::Processing) {
    spdlog::info("Session {}: status is {}, stopping after page {}", sessionId_, toString(status), pagesDone);
    return CheckpointDecision::Stop;
  }
  if (control_.stopRequested.load()) {
    session->state = PausedState{};
    repository_.put(*session);
    spdlog::info("Session {}: stop requested, paused after page {}", sessionId_, pagesDone);
    return CheckpointDecision::Stop;
  }
  return CheckpointDecision::Continue;
}
