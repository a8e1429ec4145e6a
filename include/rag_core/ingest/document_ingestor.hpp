#pragma once

#include <string>
#include <vector>

#include "rag_core/resolver/strategy_resolver.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/dataset.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

/**
 * Runs one stored document through route -> parse -> extract -> embed -> store
 * and reports what happened as a FileOutcome. Per-file problems (unsupported
 * format, exhausted parser chain, embedding or store failures) become the
 * outcome; nothing is thrown for them.
 */
class DocumentIngestor {
 public:
  explicit DocumentIngestor(StrategyResolver& resolver);

  FileOutcome ingest(const DatasetRecord& dataset, const DocumentRecord& document);

  // Parsed chunks with extractor output and the core keys every stored chunk carries.
  static std::vector<Chunk> build_chunks(const ResolvedPipeline& pipeline,
                                         const DatasetRecord& dataset,
                                         const DocumentRecord& document,
                                         std::vector<ParsedChunk> parsed,
                                         const std::string& parser_type,
                                         int& extraction_failures);

 private:
  FileOutcome run(const ResolvedPipeline& pipeline, const DatasetRecord& dataset,
                  const DocumentRecord& document);

  StrategyResolver& resolver_;
};

}  // namespace rag_core
