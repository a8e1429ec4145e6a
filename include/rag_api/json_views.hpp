#pragma once

#include <nlohmann/json.hpp>

#include "rag_core/services/database_service.hpp"
#include "rag_core/services/dataset_service.hpp"
#include "rag_core/services/query_service.hpp"
#include "rag_core/services/task_service.hpp"

namespace rag_api {

nlohmann::json to_json(const rag_core::DatasetRecord& dataset);
nlohmann::json to_json(const rag_core::DocumentRecord& document);
nlohmann::json to_json(const rag_core::DatasetInfo& info);
nlohmann::json to_json(const rag_core::UploadResult& upload);
nlohmann::json to_json(const rag_core::FileOutcome& outcome);
nlohmann::json to_json(const rag_core::IngestionTask& task);
nlohmann::json to_json(const rag_core::TaskReport& report);
nlohmann::json to_json(const rag_core::QueryResponse& response);
nlohmann::json to_json(const rag_core::DatabaseStats& stats);
nlohmann::json to_json(const rag_core::StoredDocument& document);
// "status" is "healthy" or "degraded".
nlohmann::json to_json(const rag_core::DatabaseHealth& health);

// {"database", "query", "retrieval_strategy"?, "top_k"?, "filters"?, "score_threshold"?}
// Throws std::invalid_argument on missing or mistyped fields.
rag_core::QueryRequest query_request_from_json(const nlohmann::json& body);

}  // namespace rag_api
