#include "rag_api/error_mapping.hpp"

#include <stdexcept>

#include "rag_core/db/dataset_repo.hpp"
#include "rag_core/db/task_repo.hpp"
#include "rag_core/errors.hpp"

namespace rag_api {

ApiError map_exception(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const rag_core::NotFoundError& e) {
    return {404, e.kind(), e.what()};
  } catch (const rag_core::ConfigurationError& e) {
    return {400, e.kind(), e.what()};
  } catch (const rag_core::BackendUnavailableError& e) {
    return {503, e.kind(), e.what()};
  } catch (const rag_core::RagError& e) {
    return {500, e.kind(), e.what()};
  } catch (const rag_core::TaskRepoError& e) {
    return {500, "database_error", e.what()};
  } catch (const rag_core::DatasetRepoError& e) {
    return {500, "database_error", e.what()};
  } catch (const nlohmann::json::exception& e) {
    return {400, "invalid_json", e.what()};
  } catch (const std::invalid_argument& e) {
    return {400, "invalid_argument", e.what()};
  } catch (const std::out_of_range& e) {
    return {400, "invalid_argument", e.what()};
  } catch (const std::exception& e) {
    return {500, "internal_error", e.what()};
  }
}

nlohmann::json error_body(const ApiError& error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error.message;
  response["error_type"] = error.error_type;
  return response;
}

}  // namespace rag_api
