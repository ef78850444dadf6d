#include "conversion_service.hpp"
#include "conversion_job.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string utcTimestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

bool hasPdfExtension(const std::string& filename) {
  std::string ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".pdf";
}

void removeArtifacts(const fs::path& outputDir, const Session& session) {
  std::error_code ec;
  if (const auto* done = std::get_if<CompletedState>(&session.state)) {
    fs::remove(done->outputPath, ec);
  }
  for (OutputFormat format : {OutputFormat::Csv, OutputFormat::Xlsx}) {
    const fs::path candidate = outputDir / (session.id + "." + toString(format));
    if (fs::remove(candidate, ec)) {
      spdlog::info("Session {}: removed artifact {}", session.id, candidate.string());
    }
  }
}

} // namespace

ConversionService::ConversionService(AppConfig config, std::unique_ptr<SessionRepository> repository,
                                     DocumentSourceFactory sourceFactory, std::unique_ptr<OcrEngine> ocr)
  : config_(std::move(config)), repository_(std::move(repository)),
    sourceFactory_(std::move(sourceFactory)), ocr_(std::move(ocr)) {}

ConversionService::~ConversionService() {
  std::vector<std::pair<std::string, std::shared_ptr<Slot>>> slots;
  {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    slots.assign(slots_.begin(), slots_.end());
  }

  for (auto& [id, slot] : slots) {
    slot->control.stopRequested = true;
    try {
      std::lock_guard<std::mutex> lock(slot->stateMutex);
      auto session = repository_->get(id);
      if (session && session->status() == SessionStatus::Processing) {
        session->state = PausedState{};
        repository_->put(*session);
        spdlog::info("Session {}: paused for shutdown at page {}", id, session->currentPage);
      }
    } catch (const std::exception& ex) {
      spdlog::error("Session {}: could not pause for shutdown: {}", id, ex.what());
    }
  }
  for (auto& entry : slots) {
    std::lock_guard<std::mutex> lock(entry.second->controlMutex);
    joinWorker(*entry.second);
  }
}

fs::path ConversionService::documentPath(const std::string& id) const {
  return config_.uploadDir / (id + ".pdf");
}

fs::path ConversionService::outputDir() const {
  return config_.stateDir / "outputs";
}

std::shared_ptr<ConversionService::Slot> ConversionService::slotFor(const std::string& id) {
  std::lock_guard<std::mutex> lock(slotsMutex_);
  sweepIdleSlots();
  auto& slot = slots_[id];
  if (!slot) slot = std::make_shared<Slot>();
  return slot;
}

void ConversionService::sweepIdleSlots() {
  for (auto it = slots_.begin(); it != slots_.end();) {
    Slot& slot = *it->second;
    // A slot only the map holds cannot gain a holder while slotsMutex_ is held.
    if (it->second.use_count() == 1 && (!slot.worker.joinable() || slot.finished.load())) {
      joinWorker(slot);
      it = slots_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t ConversionService::trackedSessions() const {
  std::lock_guard<std::mutex> lock(slotsMutex_);
  return slots_.size();
}

Session ConversionService::requireSession(const std::string& id) const {
  auto session = repository_->get(id);
  if (!session) throw NotFoundError("session not found: " + id);
  return *session;
}

void ConversionService::joinWorker(Slot& slot) {
  if (slot.worker.joinable()) slot.worker.join();
}

void ConversionService::launchWorker(Slot& slot, const std::string& id) {
  slot.control.stopRequested = false;
  slot.finished = false;
  JobContext ctx{id, documentPath(id), outputDir(), *repository_, slot.stateMutex,
                 slot.control, sourceFactory_, ocr_.get(), config_.pipeline};
  Slot* owner = &slot;
  slot.worker = std::thread([ctx, owner]() {
    runConversionJob(ctx);
    owner->finished = true;
  });
}

std::string ConversionService::upload(const std::string& bytes, const std::string& filename) {
  if (!hasPdfExtension(filename)) {
    throw ValidationError("invalid file type, only PDF files are allowed: " + filename);
  }
  if (bytes.empty()) throw ValidationError("empty upload: " + filename);
  if (bytes.size() > config_.maxUploadBytes) {
    throw ValidationError("file too large (" + std::to_string(bytes.size()) + " bytes, limit " +
                          std::to_string(config_.maxUploadBytes) + ")");
  }

  Session session;
  session.id = generateSessionId();
  session.filename = fs::path(filename).filename().string();
  session.createdAt = utcTimestamp();
  session.state = PendingState{};

  std::error_code ec;
  fs::create_directories(config_.uploadDir, ec);
  const fs::path target = documentPath(session.id);
  {
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) throw IoFailure("cannot store upload at " + target.string());
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!ofs) throw IoFailure("failed writing upload " + target.string());
  }
  repository_->put(session);
  spdlog::info("Session {}: uploaded {} ({} bytes)", session.id, session.filename, bytes.size());
  return session.id;
}

void ConversionService::start(const std::string& id, OutputFormat format) {
  requireSession(id);
  auto slot = slotFor(id);
  std::lock_guard<std::mutex> control(slot->controlMutex);
  // A cancelled run may still be finishing its page.
  joinWorker(*slot);
  {
    std::lock_guard<std::mutex> lock(slot->stateMutex);
    Session session = requireSession(id);
    if (session.status() != SessionStatus::Pending) {
      throw InvalidStateTransition("cannot start session in status " + toString(session.status()));
    }
    if (!fs::exists(documentPath(id))) {
      throw NotFoundError("uploaded document missing for session " + id);
    }
    repository_->clearCheckpoint(id);
    session.outputFormat = format;
    session.progress = 0;
    session.currentPage = 0;
    session.state = AnalyzingState{};
    repository_->put(session);
  }
  spdlog::info("Session {}: started, output {}", id, toString(format));
  launchWorker(*slot, id);
}

void ConversionService::pause(const std::string& id) {
  requireSession(id);
  auto slot = slotFor(id);
  std::lock_guard<std::mutex> lock(slot->stateMutex);
  Session session = requireSession(id);
  if (session.status() != SessionStatus::Processing) {
    throw InvalidStateTransition("cannot pause session in status " + toString(session.status()));
  }
  session.state = PausedState{};
  repository_->put(session);
  slot->control.stopRequested = true;
  spdlog::info("Session {}: paused at page {}/{}", id, session.currentPage, session.totalPages);
}

void ConversionService::resume(const std::string& id) {
  requireSession(id);
  auto slot = slotFor(id);
  std::lock_guard<std::mutex> control(slot->controlMutex);
  // The paused worker persists its last page before exiting.
  joinWorker(*slot);
  {
    std::lock_guard<std::mutex> lock(slot->stateMutex);
    Session session = requireSession(id);
    if (session.status() != SessionStatus::Paused) {
      throw InvalidStateTransition("cannot resume session in status " + toString(session.status()));
    }
    if (!fs::exists(documentPath(id))) {
      throw NotFoundError("uploaded document missing for session " + id);
    }
    session.state = ProcessingState{};
    repository_->put(session);
    spdlog::info("Session {}: resuming at page {}/{}", id, session.currentPage, session.totalPages);
  }
  launchWorker(*slot, id);
}

void ConversionService::cancel(const std::string& id) {
  requireSession(id);
  auto slot = slotFor(id);
  std::lock_guard<std::mutex> lock(slot->stateMutex);
  Session session = requireSession(id);
  slot->control.stopRequested = true;
  removeArtifacts(outputDir(), session);
  repository_->clearCheckpoint(id);
  session.state = PendingState{};
  session.progress = 0;
  session.currentPage = 0;
  session.outputFormat.reset();
  repository_->put(session);
  spdlog::info("Session {}: cancelled, reset to pending", id);
}

Session ConversionService::status(const std::string& id) const {
  return requireSession(id);
}

ProgressInfo ConversionService::progress(const std::string& id) const {
  return progressOf(requireSession(id));
}

std::vector<Session> ConversionService::listSessions() const {
  return repository_->list();
}

Artifact ConversionService::download(const std::string& id) const {
  Session session = requireSession(id);
  const auto* done = std::get_if<CompletedState>(&session.state);
  if (!done) {
    throw InvalidStateTransition("session not completed (status " + toString(session.status()) + ")");
  }
  if (!fs::exists(done->outputPath)) {
    throw NotFoundError("output file not found for session " + id);
  }

  std::ifstream ifs(done->outputPath, std::ios::binary);
  if (!ifs) throw IoFailure("cannot read " + done->outputPath.string());
  std::ostringstream buffer;
  buffer << ifs.rdbuf();

  Artifact artifact;
  artifact.filename = fs::path(session.filename).stem().string() + "." +
                      toString(session.outputFormat.value_or(OutputFormat::Csv));
  artifact.bytes = buffer.str();
  return artifact;
}

void ConversionService::wait(const std::string& id) {
  {
    auto slot = slotFor(id);
    std::lock_guard<std::mutex> control(slot->controlMutex);
    joinWorker(*slot);
  }
  std::lock_guard<std::mutex> lock(slotsMutex_);
  sweepIdleSlots();
}
