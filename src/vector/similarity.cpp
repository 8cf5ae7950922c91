#include "similarity.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace sailcpp::vector {

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  const std::size_t count = std::min(lhs.size(), rhs.size());
  float dot = 0.0F;
  for (std::size_t i = 0; i < count; ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float Norm(std::span<const float> v) {
  const auto dot = Dot(v, v);
  return std::sqrt(std::max(dot, 0.0F));
}

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  if (lhs.size() != rhs.size()) {
    return 0.0F;
  }
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return Dot(lhs, rhs) / (lhs_norm * rhs_norm);
}

}  // namespace sailcpp::vector
