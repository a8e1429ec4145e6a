#include "rag_api/json_views.hpp"

#include <stdexcept>

#include "rag_core/db/sqlite_support.hpp"

namespace rag_api {

using rag_core::time_point_to_string;

nlohmann::json to_json(const rag_core::DatasetRecord& dataset) {
  return {{"name", dataset.name},
          {"data_processing_strategy", dataset.data_processing_strategy},
          {"database", dataset.database_name},
          {"created_at", time_point_to_string(dataset.created_at)}};
}

nlohmann::json to_json(const rag_core::DocumentRecord& document) {
  return {{"filename", document.filename},
          {"content_hash", document.content_hash},
          {"format", document.format},
          {"byte_size", document.byte_size},
          {"ingested_at", time_point_to_string(document.ingested_at)}};
}

nlohmann::json to_json(const rag_core::DatasetInfo& info) {
  nlohmann::json result = to_json(info.dataset);
  nlohmann::json documents = nlohmann::json::array();
  for (const auto& document : info.documents) {
    documents.push_back(to_json(document));
  }
  result["documents"] = documents;
  result["document_count"] = info.documents.size();
  return result;
}

nlohmann::json to_json(const rag_core::UploadResult& upload) {
  nlohmann::json result = {{"filename", upload.filename},
                           {"content_hash", upload.content_hash},
                           {"format", upload.format},
                           {"byte_size", upload.byte_size},
                           {"processed", upload.processed},
                           {"skipped", upload.skipped}};
  if (upload.outcome) {
    result["outcome"] = to_json(*upload.outcome);
  }
  return result;
}

nlohmann::json to_json(const rag_core::FileOutcome& outcome) {
  return {{"filename", outcome.filename},
          {"content_hash", outcome.content_hash},
          {"outcome", rag_core::to_string(outcome.outcome)},
          {"detail", outcome.detail},
          {"chunk_count", outcome.chunk_count},
          {"failed_chunks", outcome.failed_chunks},
          {"extraction_failures", outcome.extraction_failures}};
}

nlohmann::json to_json(const rag_core::IngestionTask& task) {
  return {{"id", task.id},
          {"task_type", task.task_type},
          {"status", rag_core::to_string(task.status)},
          {"priority", task.priority},
          {"dataset", task.dataset_name},
          {"cancel_requested", task.cancel_requested},
          {"error_message", task.error_message},
          {"created_at", time_point_to_string(task.created_at)},
          {"updated_at", time_point_to_string(task.updated_at)}};
}

nlohmann::json to_json(const rag_core::TaskReport& report) {
  nlohmann::json result = to_json(report.task);

  nlohmann::json outcomes = nlohmann::json::array();
  nlohmann::json files_by_outcome = nlohmann::json::object();
  for (const auto& outcome : report.outcomes) {
    outcomes.push_back(to_json(outcome));
    files_by_outcome[rag_core::to_string(outcome.outcome)].push_back(outcome.filename);
  }
  result["outcomes"] = outcomes;
  result["files_by_outcome"] = files_by_outcome;
  result["counts"] = {{"processed", report.counts.processed},
                      {"failed", report.counts.failed},
                      {"skipped_duplicate", report.counts.skipped_duplicate},
                      {"skipped_unsupported", report.counts.skipped_unsupported},
                      {"cancelled", report.counts.cancelled},
                      {"total", report.counts.total()}};
  if (report.progress) {
    result["progress_percent"] = report.progress->progress_percent;
    result["status_message"] = report.progress->status_message;
  }
  return result;
}

nlohmann::json to_json(const rag_core::QueryResponse& response) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& scored : response.results) {
    results.push_back({{"id", scored.chunk.id},
                       {"text", scored.chunk.content},
                       {"metadata", scored.chunk.metadata},
                       {"score", scored.score}});
  }
  return {{"database", response.database},
          {"retrieval_strategy", response.retrieval_strategy},
          {"results", results},
          {"count", response.results.size()}};
}

nlohmann::json to_json(const rag_core::DatabaseStats& stats) {
  return {{"database", stats.name},
          {"store_type", stats.store_type},
          {"dimension", stats.dimension},
          {"distance_metric", stats.distance_metric},
          {"chunk_count", stats.chunk_count},
          {"document_count", stats.document_count},
          {"embedding_strategies", stats.embedding_strategies},
          {"default_embedding_strategy", stats.default_embedding_strategy},
          {"retrieval_strategies", stats.retrieval_strategies},
          {"default_retrieval_strategy", stats.default_retrieval_strategy}};
}

nlohmann::json to_json(const rag_core::StoredDocument& document) {
  return {{"content_hash", document.content_hash}, {"chunk_count", document.chunk_count}};
}

nlohmann::json to_json(const rag_core::DatabaseHealth& health) {
  nlohmann::json components = nlohmann::json::array();
  for (const auto& component : health.components) {
    components.push_back({{"name", component.name},
                          {"kind", component.kind},
                          {"type", component.type},
                          {"healthy", component.healthy},
                          {"detail", component.detail}});
  }
  return {{"database", health.name},
          {"status", health.healthy ? "healthy" : "degraded"},
          {"components", components}};
}

rag_core::QueryRequest query_request_from_json(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("Query body must be a JSON object");
  }
  if (!body.contains("database") || !body.at("database").is_string()) {
    throw std::invalid_argument("Query needs a string 'database'");
  }
  if (!body.contains("query") || !body.at("query").is_string()) {
    throw std::invalid_argument("Query needs a string 'query'");
  }

  rag_core::QueryRequest request;
  request.database = body.at("database").get<std::string>();
  request.query_text = body.at("query").get<std::string>();
  if (body.contains("retrieval_strategy") && !body.at("retrieval_strategy").is_null()) {
    if (!body.at("retrieval_strategy").is_string()) {
      throw std::invalid_argument("'retrieval_strategy' must be a string");
    }
    request.retrieval_strategy = body.at("retrieval_strategy").get<std::string>();
  }
  if (body.contains("top_k")) {
    if (!body.at("top_k").is_number_integer() || body.at("top_k").get<long long>() <= 0) {
      throw std::invalid_argument("'top_k' must be a positive integer");
    }
    request.top_k = body.at("top_k").get<size_t>();
  }
  if (body.contains("filters") && !body.at("filters").is_null()) {
    request.filter = rag_core::MetadataFilter::from_json(body.at("filters"));
  }
  if (body.contains("score_threshold") && !body.at("score_threshold").is_null()) {
    if (!body.at("score_threshold").is_number()) {
      throw std::invalid_argument("'score_threshold' must be a number");
    }
    request.score_threshold = body.at("score_threshold").get<double>();
  }
  return request;
}

}  // namespace rag_api
