#include "ocr_engine.hpp"
#include "document_source.hpp"
#include "errors.hpp"
#include "session_repository.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

// Removes the rendered page image however recognition ends.
struct TempFileGuard {
  fs::path path;
  ~TempFileGuard() {
    std::error_code ec;
    fs::remove(path, ec);
  }
};

} // namespace

TesseractOcrEngine::TesseractOcrEngine(std::string tesseractCommand, std::string languages, int dpi)
  : command_(std::move(tesseractCommand)), languages_(std::move(languages)), dpi_(dpi) {}

std::string TesseractOcrEngine::recognizePage(const fs::path& document, int page) {
  if (!commandExists("pdftoppm")) throw ExtractionFailure("pdftoppm not found; install poppler-utils");
  if (!commandExists(shellQuote(command_))) throw ExtractionFailure("tesseract not found: " + command_);

  const fs::path prefix = fs::temp_directory_path() / ("pdftab-ocr-" + generateSessionId());
  TempFileGuard image{prefix.string() + ".png"};
  const std::string n = std::to_string(page + 1);

  runCommand("pdftoppm -f " + n + " -l " + n + " -r " + std::to_string(dpi_) +
             " -png -singlefile " + shellQuote(document.string()) + " " + shellQuote(prefix.string()) +
             " 2>/dev/null");
  std::string text = runCommand(shellQuote(command_) + " " + shellQuote(image.path.string()) +
                                " stdout -l " + shellQuote(languages_) + " 2>/dev/null");
  spdlog::debug("OCR recognized {} bytes on page {}", text.size(), page + 1);
  return text;
}
