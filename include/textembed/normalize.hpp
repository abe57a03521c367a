#pragma once

#include <cstddef>
#include <vector>

namespace textembed {

/** Added to the L2 norm so that all-zero vectors divide cleanly. */
inline constexpr float kNormEpsilon = 1e-12f;

namespace internal {

/**
 * L2-normalize a vector.
 *
 * Every element is divided by (||v|| + kNormEpsilon). An all-zero input
 * yields an all-zero output of the same length.
 *
 * @param data Pointer to `size` contiguous floats
 * @param size Number of elements
 * @return Normalized copy
 */
std::vector<float> Normalize(const float* data, size_t size);

inline std::vector<float> Normalize(const std::vector<float>& v) {
  return Normalize(v.data(), v.size());
}

/** Euclidean norm, accumulated in double precision. */
float L2Norm(const float* data, size_t size);

}  // namespace internal
}  // namespace textembed
