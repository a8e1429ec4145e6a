#pragma once

#include <exception>
#include <string>

namespace rag_core {

// Base of every error raised by the pipeline. The kind string is stable and is
// what the HTTP layer reports as "error_type".
class RagError : public std::exception {
 public:
  explicit RagError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  virtual const char* kind() const noexcept {
    return "rag_error";
  }

 private:
  std::string message_;
};

// Invalid strategy reference, incompatible chunk sizing, dimensionality mismatch.
class ConfigurationError : public RagError {
 public:
  explicit ConfigurationError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "configuration_error";
  }
};

class FormatUnsupportedError : public RagError {
 public:
  explicit FormatUnsupportedError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "format_unsupported";
  }
};

class ParseError : public RagError {
 public:
  explicit ParseError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "parse_error";
  }
};

class ExtractionError : public RagError {
 public:
  explicit ExtractionError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "extraction_error";
  }
};

class EmbeddingError : public RagError {
 public:
  EmbeddingError(const std::string& message, bool transient)
      : RagError(message), transient_(transient) {}

  // Transient errors (backend unreachable, timeouts) are worth retrying.
  bool is_transient() const noexcept {
    return transient_;
  }
  const char* kind() const noexcept override {
    return "embedding_error";
  }

 private:
  bool transient_;
};

class StoreError : public RagError {
 public:
  explicit StoreError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "store_error";
  }
};

// The embedding or store backend cannot be reached at all. Distinct from a
// query that ran and found nothing.
class BackendUnavailableError : public RagError {
 public:
  explicit BackendUnavailableError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "backend_unavailable";
  }
};

class NotFoundError : public RagError {
 public:
  explicit NotFoundError(const std::string& message) : RagError(message) {}
  const char* kind() const noexcept override {
    return "not_found";
  }
};

}  // namespace rag_core
