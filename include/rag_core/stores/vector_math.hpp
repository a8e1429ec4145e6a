#pragma once

#include <vector>

namespace rag_core::vector_math {

float dot(const std::vector<float>& a, const std::vector<float>& b);
float l2_norm(const std::vector<float>& v);
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
float l2_distance(const std::vector<float>& a, const std::vector<float>& b);

// Unit-length copy; the zero vector is returned unchanged.
std::vector<float> normalized(const std::vector<float>& v);

}  // namespace rag_core::vector_math
