#pragma once

#include "config.hpp"
#include "document_source.hpp"
#include "session.hpp"

// Priority: tables > RTL text > images > plain text.
ExtractionStrategy chooseStrategy(bool hasTables, bool hasRtlText, bool hasImages);

// Samples the first `options.samplePages` pages (fewer if the document is
// shorter) and OR-accumulates: tables found by the structured extractor,
// embedded images, RTL codepoints in the plain text. The verdict applies to the
// whole run. Extraction errors propagate.
AnalysisResult analyzeDocument(DocumentSource& source, const PipelineOptions& options);
