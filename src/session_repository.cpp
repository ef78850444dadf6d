#include "session_repository.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw IoFailure("cannot open " + path.string());
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

void writeFileAtomically(const fs::path& path, const std::string& content) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) throw IoFailure("cannot write " + tmp.string());
    ofs << content;
    ofs.flush();
    if (!ofs) throw IoFailure("short write to " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) throw IoFailure("cannot replace " + path.string() + ": " + ec.message());
}

} // namespace

bool isValidSessionId(const std::string& id) {
  static const std::regex uuidRe("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");
  return std::regex_match(id, uuidRe);
}

std::string generateSessionId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<unsigned> nibble(0, 15);
  const char* hex = "0123456789abcdef";
  std::string id = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
  for (auto& ch : id) {
    if (ch == 'x') ch = hex[nibble(rng)];
    else if (ch == 'y') ch = hex[8 + (nibble(rng) & 3)];
  }
  return id;
}

FileSessionRepository::FileSessionRepository(fs::path dir) : dir_(std::move(dir)) {
  std::error_code ec;
  fs::create_directories(dir_ / "checkpoints", ec);
  if (ec) throw IoFailure("cannot create state directory " + dir_.string() + ": " + ec.message());
}

fs::path FileSessionRepository::recordPath(const std::string& id) const {
  return dir_ / (id + ".json");
}

fs::path FileSessionRepository::checkpointPath(const std::string& id) const {
  return dir_ / "checkpoints" / (id + ".json");
}

std::optional<Session> FileSessionRepository::get(const std::string& id) const {
  if (!isValidSessionId(id)) return std::nullopt;
  fs::path path = recordPath(id);
  if (!fs::exists(path)) return std::nullopt;
  try {
    return sessionFromJson(parseJson(readFile(path)));
  } catch (const std::exception& ex) {
    throw IoFailure("corrupt session record " + path.string() + ": " + ex.what());
  }
}

void FileSessionRepository::put(const Session& session) {
  writeFileAtomically(recordPath(session.id), writeJson(sessionToJson(session)));
}

std::vector<Session> FileSessionRepository::list() const {
  std::vector<Session> sessions;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    try {
      sessions.push_back(sessionFromJson(parseJson(readFile(entry.path()))));
    } catch (const std::exception& ex) {
      spdlog::debug("Skipping unreadable session record {}: {}", entry.path().string(), ex.what());
    }
  }
  std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
    return a.createdAt == b.createdAt ? a.id < b.id : a.createdAt < b.createdAt;
  });
  return sessions;
}

std::optional<PageCheckpoint> FileSessionRepository::loadCheckpoint(const std::string& id) const {
  if (!isValidSessionId(id)) return std::nullopt;
  fs::path path = checkpointPath(id);
  if (!fs::exists(path)) return std::nullopt;
  try {
    return checkpointFromJson(parseJson(readFile(path)));
  } catch (const std::exception& ex) {
    spdlog::warn("Session {}: ignoring unreadable checkpoint: {}", id, ex.what());
    return std::nullopt;
  }
}

void FileSessionRepository::saveCheckpoint(const std::string& id, const PageCheckpoint& checkpoint) {
  writeFileAtomically(checkpointPath(id), writeJson(checkpointToJson(checkpoint)));
}

void FileSessionRepository::clearCheckpoint(const std::string& id) {
  std::error_code ec;
  fs::remove(checkpointPath(id), ec);
}

std::optional<Session> InMemorySessionRepository::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

void InMemorySessionRepository::put(const Session& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[session.id] = session;
}

std::vector<Session> InMemorySessionRepository::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Session> out;
  for (const auto& kv : sessions_) out.push_back(kv.second);
  return out;
}

std::optional<PageCheckpoint> InMemorySessionRepository::loadCheckpoint(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = checkpoints_.find(id);
  if (it == checkpoints_.end()) return std::nullopt;
  return it->second;
}

void InMemorySessionRepository::saveCheckpoint(const std::string& id, const PageCheckpoint& checkpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  checkpoints_[id] = checkpoint;
}

void InMemorySessionRepository::clearCheckpoint(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  checkpoints_.erase(id);
}
