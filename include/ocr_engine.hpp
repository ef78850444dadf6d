#pragma once

#include <filesystem>
#include <string>

class OcrEngine {
public:
  virtual ~OcrEngine() = default;
  // Recognizes the text of one 0-based page. Throws on engine failure.
  virtual std::string recognizePage(const std::filesystem::path& document, int page) = 0;
};

// Renders the page with `pdftoppm` and feeds the image to the tesseract CLI.
class TesseractOcrEngine : public OcrEngine {
public:
  TesseractOcrEngine(std::string tesseractCommand, std::string languages, int dpi = 300);

  std::string recognizePage(const std::filesystem::path& document, int page) override;

private:
  std::string command_;
  std::string languages_;
  int dpi_;
};
