#include "rag_core/ingest/document_ingestor.hpp"

#include <filesystem>
#include <iostream>
#include <unordered_set>

#include "rag_core/errors.hpp"
#include "rag_core/hashing/content_hasher.hpp"

namespace rag_core {

namespace {

FileOutcome make_outcome(const DocumentRecord& document, FileOutcomeKind kind,
                         const std::string& detail) {
  FileOutcome outcome;
  outcome.filename = document.filename;
  outcome.content_hash = document.content_hash;
  outcome.outcome = kind;
  outcome.detail = detail;
  return outcome;
}

}  // namespace

DocumentIngestor::DocumentIngestor(StrategyResolver& resolver) : resolver_(resolver) {}

FileOutcome DocumentIngestor::ingest(const DatasetRecord& dataset, const DocumentRecord& document) {
  try {
    ResolvedPipelinePtr pipeline =
        resolver_.resolve(dataset.data_processing_strategy, dataset.database_name);
    return run(*pipeline, dataset, document);
  } catch (const BackendUnavailableError& e) {
    std::cerr << "[DocumentIngestor] Backend unavailable for " << document.filename << ": "
              << e.what() << std::endl;
    return make_outcome(document, FileOutcomeKind::FAILED,
                        std::string("backend unavailable: ") + e.what());
  } catch (const RagError& e) {
    std::cerr << "[DocumentIngestor] " << e.kind() << " for " << document.filename << ": "
              << e.what() << std::endl;
    return make_outcome(document, FileOutcomeKind::FAILED,
                        std::string(e.kind()) + ": " + e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[DocumentIngestor] File error for " << document.filename << ": " << e.what()
              << std::endl;
    return make_outcome(document, FileOutcomeKind::FAILED, e.what());
  } catch (const std::exception& e) {
    std::cerr << "[DocumentIngestor] Unexpected error for " << document.filename << ": "
              << e.what() << std::endl;
    return make_outcome(document, FileOutcomeKind::FAILED,
                        std::string("internal error: ") + e.what());
  }
}

FileOutcome DocumentIngestor::run(const ResolvedPipeline& pipeline, const DatasetRecord& dataset,
                                  const DocumentRecord& document) {
  VectorStore& store = *pipeline.database->store;
  if (store.contains_document(document.content_hash)) {
    return make_outcome(document, FileOutcomeKind::SKIPPED_DUPLICATE,
                        "already present in database " + pipeline.database->name);
  }

  RouteDecision decision = pipeline.router->route_file(document.filename, document.stored_path);
  if (!decision.supported()) {
    return make_outcome(document, FileOutcomeKind::SKIPPED_UNSUPPORTED,
                        "unsupported format: " + decision.format);
  }

  ParseOutcome parsed;
  try {
    parsed = pipeline.parser_chain(decision).parse(document.stored_path);
  } catch (const ParseError& e) {
    return make_outcome(document, FileOutcomeKind::FAILED, e.what());
  }

  FileOutcome outcome = make_outcome(document, FileOutcomeKind::PROCESSED, "");
  std::vector<Chunk> chunks = build_chunks(pipeline, dataset, document, std::move(parsed.chunks),
                                           parsed.parser_type, outcome.extraction_failures);
  outcome.detail = "parsed by " + parsed.parser_type;
  if (parsed.attempts.size() > 1) {
    outcome.detail += " after " + std::to_string(parsed.attempts.size() - 1) + " failed parser(s)";
  }
  if (chunks.empty()) {
    outcome.detail += ", no content";
    return outcome;
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.content);
  }
  EmbeddingBatchResult embedded = pipeline.database->embedder()->embed_all(texts);

  std::vector<Chunk> ready;
  ready.reserve(chunks.size());
  std::string first_error;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (embedded.vectors[i]) {
      chunks[i].vector_embedding = std::move(*embedded.vectors[i]);
      ready.push_back(std::move(chunks[i]));
    } else {
      ++outcome.failed_chunks;
      if (first_error.empty()) {
        first_error = embedded.errors[i];
      }
      std::cerr << "[DocumentIngestor] Chunk " << chunks[i].chunk_index << " of "
                << document.filename << " not embedded: " << embedded.errors[i] << std::endl;
    }
  }
  if (ready.empty()) {
    return make_outcome(document, FileOutcomeKind::FAILED,
                        "all " + std::to_string(chunks.size()) +
                            " chunks failed to embed: " + first_error);
  }

  std::vector<std::string> inserted = store.upsert(ready);
  if (inserted.empty()) {
    // Another task stored the same content between the check above and the upsert.
    return make_outcome(document, FileOutcomeKind::SKIPPED_DUPLICATE,
                        "already present in database " + pipeline.database->name);
  }
  outcome.chunk_count = static_cast<int>(inserted.size());
  std::cout << "[DocumentIngestor] Stored " << inserted.size() << " chunks of "
            << document.filename << " (" << outcome.detail << ")" << std::endl;
  return outcome;
}

std::vector<Chunk> DocumentIngestor::build_chunks(const ResolvedPipeline& pipeline,
                                                  const DatasetRecord& dataset,
                                                  const DocumentRecord& document,
                                                  std::vector<ParsedChunk> parsed,
                                                  const std::string& parser_type,
                                                  int& extraction_failures) {
  std::vector<Chunk> chunks;
  chunks.reserve(parsed.size());
  std::unordered_set<std::string> seen_hashes;

  for (size_t i = 0; i < parsed.size(); ++i) {
    Chunk chunk;
    chunk.chunk_index = static_cast<int>(i);
    chunk.document_hash = document.content_hash;
    chunk.chunk_hash = ContentHasher::sha256_hex(parsed[i].text);
    if (pipeline.strategy.deduplicate_chunks && !seen_hashes.insert(chunk.chunk_hash).second) {
      continue;
    }
    chunk.id = ContentHasher::chunk_id(document.content_hash, chunk.chunk_index);
    chunk.content = std::move(parsed[i].text);
    chunk.metadata = std::move(parsed[i].metadata);

    auto failures = pipeline.extractors->apply(document.filename, chunk.content, chunk.metadata);
    for (const auto& failure : failures) {
      std::cerr << "[DocumentIngestor] " << failure.extractor_type << " failed on chunk " << i
                << " of " << document.filename << ": " << failure.error << std::endl;
    }
    extraction_failures += static_cast<int>(failures.size());
    chunks.push_back(std::move(chunk));
  }

  for (auto& chunk : chunks) {
    chunk.metadata["document_hash"] = chunk.document_hash;
    chunk.metadata["chunk_hash"] = chunk.chunk_hash;
    chunk.metadata["chunk_index"] = chunk.chunk_index;
    chunk.metadata["total_chunks"] = chunks.size();
    chunk.metadata["filename"] = document.filename;
    chunk.metadata["dataset"] = dataset.name;
    chunk.metadata["format"] = document.format;
    chunk.metadata["parser"] = parser_type;
  }
  return chunks;
}

}  // namespace rag_core
