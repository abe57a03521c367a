#pragma once

#include <textembed/status.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace textembed {

enum class TensorType {
  kInt64,
  kFloat32
};

/**
 * Dense row-major tensor owning its data.
 *
 * This is the currency between the embedding pipeline and an inference
 * session; sessions convert to and from their engine's native value type.
 */
class Tensor {
 public:
  Tensor() = default;

  /**
   * Wrap `data` with the given shape.
   * Fails with TensorShapeError if the element count does not match.
   */
  static Status FromInt64(std::vector<int64_t> data,
                          std::vector<int64_t> shape,
                          Tensor* out);
  static Status FromFloat(std::vector<float> data,
                          std::vector<int64_t> shape,
                          Tensor* out);

  TensorType type() const { return type_; }
  const std::vector<int64_t>& shape() const { return shape_; }
  size_t rank() const { return shape_.size(); }
  size_t ElementCount() const;

  // Only the vector matching type() is populated.
  const std::vector<int64_t>& int64_data() const { return int64_data_; }
  const std::vector<float>& float_data() const { return float_data_; }

 private:
  TensorType type_ = TensorType::kFloat32;
  std::vector<int64_t> shape_;
  std::vector<int64_t> int64_data_;
  std::vector<float> float_data_;
};

using NamedTensors = std::map<std::string, Tensor>;

/**
 * Product of `shape`, or an error for negative dimensions.
 */
Status ShapeElementCount(const std::vector<int64_t>& shape, size_t* out);

std::string ShapeToString(const std::vector<int64_t>& shape);

}  // namespace textembed
