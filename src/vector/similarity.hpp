#pragma once

#include <span>

namespace sailcpp::vector {

[[nodiscard]] float Dot(std::span<const float> lhs, std::span<const float> rhs);
[[nodiscard]] float Norm(std::span<const float> v);
// 0 when either side has zero norm or the dimensions differ.
[[nodiscard]] float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs);

}  // namespace sailcpp::vector
