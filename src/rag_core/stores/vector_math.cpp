#include "rag_core/stores/vector_math.hpp"

#include <cmath>

namespace rag_core::vector_math {

float dot(const std::vector<float>& a, const std::vector<float>& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    sum += static_cast<double>(a[i]) * b[i];
  }
  return static_cast<float>(sum);
}

float l2_norm(const std::vector<float>& v) {
  return std::sqrt(dot(v, v));
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  const float denominator = l2_norm(a) * l2_norm(b);
  if (denominator == 0.0f) {
    return 0.0f;
  }
  return dot(a, b) / denominator;
}

float l2_distance(const std::vector<float>& a, const std::vector<float>& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    const double d = static_cast<double>(a[i]) - b[i];
    sum += d * d;
  }
  return static_cast<float>(std::sqrt(sum));
}

std::vector<float> normalized(const std::vector<float>& v) {
  const float norm = l2_norm(v);
  if (norm == 0.0f) {
    return v;
  }
  std::vector<float> out(v.size());
  for (size_t i = 0; i < v.size(); ++i) {
    out[i] = v[i] / norm;
  }
  return out;
}

}  // namespace rag_core::vector_math
