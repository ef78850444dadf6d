#include "strategy_selector.hpp"
#include "rtl_text.hpp"
#include "structured_extractor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

ExtractionStrategy chooseStrategy(bool hasTables, bool hasRtlText, bool hasImages) {
  if (hasTables) return ExtractionStrategy::Structured;
  if (hasRtlText) return ExtractionStrategy::RtlOptimized;
  if (hasImages) return ExtractionStrategy::Ocr;
  return ExtractionStrategy::PlainText;
}

AnalysisResult analyzeDocument(DocumentSource& source, const PipelineOptions& options) {
  AnalysisResult result;
  result.pageCount = source.pageCount();

  const int pagesToCheck = std::min(std::max(options.samplePages, 0), result.pageCount);
  for (int page = 0; page < pagesToCheck; ++page) {
    if (!result.hasTables && extractStructuredTable(source.wordFragments(page))) {
      result.hasTables = true;
    }
    if (!result.hasImages && source.hasImages(page)) {
      result.hasImages = true;
    }
    if (!result.hasRtlText && containsRtlText(source.plainText(page))) {
      result.hasRtlText = true;
    }
  }

  result.suggestedStrategy = chooseStrategy(result.hasTables, result.hasRtlText, result.hasImages);
  spdlog::info("Document analysis: {} pages, tables={}, images={}, rtl={}, strategy={}",
               result.pageCount, result.hasTables, result.hasImages, result.hasRtlText,
               toString(result.suggestedStrategy));
  return result;
}
