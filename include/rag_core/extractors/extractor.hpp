#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace rag_core {

// Derives metadata from one chunk. `metadata` holds what earlier extractors
// produced; the returned object is merged by the pipeline according to its
// merge policy. Failures are reported by throwing ExtractionError.
class Extractor {
 public:
  virtual ~Extractor() = default;

  virtual std::string type() const = 0;

  virtual nlohmann::json extract(const std::string& text, const nlohmann::json& metadata) const = 0;
};

using ExtractorPtr = std::shared_ptr<Extractor>;

}  // namespace rag_core
