#include "config.hpp"
#include "conversion_service.hpp"
#include "errors.hpp"
#include "session_codec.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

enum ExitCode {
  kOk = 0,
  kUnexpected = 1,
  kUsage = 2,
  kNotFound = 3,
  kInvalidState = 4,
  kJobFailed = 5
};

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--upload-dir=DIR] [--state-dir=DIR] [--log-level=LVL] <command>\n"
            << "Commands:\n"
            << "  upload <file.pdf>\n"
            << "  start <id> [--format=csv|xlsx]\n"
            << "  pause <id>\n"
            << "  resume <id>\n"
            << "  cancel <id>\n"
            << "  status <id>\n"
            << "  progress <id>\n"
            << "  list\n"
            << "  download <id> [--out=DIR]\n"
            << "  convert <file.pdf> [--format=csv|xlsx] [--out=DIR]\n";
}

std::string readFile(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw NotFoundError("file not found: " + path.string());
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  return buffer.str();
}

fs::path saveArtifact(const Artifact& artifact, const fs::path& outDir) {
  std::error_code ec;
  fs::create_directories(outDir, ec);
  const fs::path target = outDir / artifact.filename;
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) throw IoFailure("cannot write " + target.string());
  ofs.write(artifact.bytes.data(), static_cast<std::streamsize>(artifact.bytes.size()));
  if (!ofs) throw IoFailure("failed writing " + target.string());
  return target;
}

// Prints the final snapshot of a foreground run.
int reportRun(ConversionService& service, const std::string& id) {
  Session session = service.status(id);
  std::cout << writeJson(sessionToJson(session), true) << "\n";
  return session.status() == SessionStatus::Error ? kJobFailed : kOk;
}

} // namespace

int main(int argc, char** argv)
{
  AppConfig config;
  try {
    config = loadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "Configuration error: " << ex.what() << "\n";
    return kUsage;
  }

  std::vector<std::string> positional;
  std::string formatName = "csv";
  fs::path outDir = ".";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string error;
    if (applyConfigFlag(arg, config, error)) continue;
    if (!error.empty()) {
      std::cerr << error << "\n";
      return kUsage;
    }
    if (arg.rfind("--format=", 0) == 0) {
      formatName = arg.substr(std::string("--format=").size());
    } else if (arg.rfind("--out=", 0) == 0) {
      outDir = arg.substr(std::string("--out=").size());
    } else if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return kOk;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return kUsage;
    } else {
      positional.push_back(arg);
    }
  }

  auto logger = spdlog::stderr_color_mt("pdftabulate");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(config.logLevel));

  if (positional.empty()) {
    printUsage(argv[0]);
    return kUsage;
  }
  const std::string command = positional[0];
  auto requireArg = [&](const char* what) -> const std::string& {
    if (positional.size() < 2) throw ValidationError(command + " requires " + what);
    return positional[1];
  };

  try {
    std::unique_ptr<OcrEngine> ocr;
    if (commandExists(config.tesseractCommand)) {
      ocr = std::make_unique<TesseractOcrEngine>(config.tesseractCommand, config.tesseractLanguages);
    } else {
      spdlog::warn("{} not found, OCR disabled", config.tesseractCommand);
    }
    ConversionService service(config, std::make_unique<FileSessionRepository>(config.stateDir),
                              popplerSourceFactory(), std::move(ocr));

    if (command == "upload") {
      const fs::path file = requireArg("a PDF file");
      std::cout << service.upload(readFile(file), file.filename().string()) << "\n";
    } else if (command == "start") {
      const std::string id = requireArg("a session id");
      service.start(id, parseOutputFormat(formatName));
      service.wait(id);
      return reportRun(service, id);
    } else if (command == "pause") {
      service.pause(requireArg("a session id"));
    } else if (command == "resume") {
      const std::string id = requireArg("a session id");
      service.resume(id);
      service.wait(id);
      return reportRun(service, id);
    } else if (command == "cancel") {
      service.cancel(requireArg("a session id"));
    } else if (command == "status") {
      std::cout << writeJson(sessionToJson(service.status(requireArg("a session id"))), true) << "\n";
    } else if (command == "progress") {
      std::cout << writeJson(progressToJson(service.progress(requireArg("a session id"))), true) << "\n";
    } else if (command == "list") {
      Json::Value list(Json::arrayValue);
      for (const auto& session : service.listSessions()) list.append(sessionToJson(session));
      std::cout << writeJson(list, true) << "\n";
    } else if (command == "download") {
      const fs::path target = saveArtifact(service.download(requireArg("a session id")), outDir);
      std::cout << target.string() << "\n";
    } else if (command == "convert") {
      const fs::path file = requireArg("a PDF file");
      const OutputFormat format = parseOutputFormat(formatName);
      const std::string id = service.upload(readFile(file), file.filename().string());
      service.start(id, format);
      service.wait(id);
      const Session session = service.status(id);
      if (session.status() != SessionStatus::Completed) return reportRun(service, id);
      std::cout << saveArtifact(service.download(id), outDir).string() << "\n";
    } else {
      std::cerr << "Unknown command: " << command << "\n";
      printUsage(argv[0]);
      return kUsage;
    }
    return kOk;
  } catch (const ValidationError& ex) {
    spdlog::error("{}: {}", ex.code(), ex.what());
    return kUsage;
  } catch (const NotFoundError& ex) {
    spdlog::error("{}: {}", ex.code(), ex.what());
    return kNotFound;
  } catch (const InvalidStateTransition& ex) {
    spdlog::error("{}: {}", ex.code(), ex.what());
    return kInvalidState;
  } catch (const std::exception& ex) {
    spdlog::error("Error: {}", ex.what());
    return kUnexpected;
  }
}
