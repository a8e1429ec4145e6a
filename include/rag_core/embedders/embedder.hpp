#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rag_core {

// Maps texts to fixed-length vectors. Output order matches input order.
// Failures are reported as EmbeddingError, flagged transient or permanent.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::string type() const = 0;

  // Declared vector length, checked against the database at resolution time.
  virtual size_t dimension() const = 0;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;

  // Cheap reachability check for health reporting. In-process embedders are
  // always available.
  virtual bool is_available() const {
    return true;
  }
};

using EmbedderPtr = std::shared_ptr<Embedder>;

}  // namespace rag_core
