#include <textembed/normalize.hpp>

#include <cmath>

namespace textembed::internal {

float L2Norm(const float* data, size_t size) {
  double sum = 0.0;
  for (size_t i = 0; i < size; ++i) {
    sum += static_cast<double>(data[i]) * static_cast<double>(data[i]);
  }
  return static_cast<float>(std::sqrt(sum));
}

std::vector<float> Normalize(const float* data, size_t size) {
  std::vector<float> out(size);
  const float denom = L2Norm(data, size) + kNormEpsilon;
  for (size_t i = 0; i < size; ++i) {
    out[i] = data[i] / denom;
  }
  return out;
}

}  // namespace textembed::internal
