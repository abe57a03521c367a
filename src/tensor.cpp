#include <textembed/tensor.hpp>

#include <sstream>

namespace textembed {

Status ShapeElementCount(const std::vector<int64_t>& shape, size_t* out) {
  size_t count = 1;
  for (int64_t dim : shape) {
    if (dim < 0) {
      return Status::TensorShapeError("Negative dimension in shape " +
                                      ShapeToString(shape));
    }
    count *= static_cast<size_t>(dim);
  }
  *out = count;
  return Status::OK();
}

std::string ShapeToString(const std::vector<int64_t>& shape) {
  std::ostringstream oss;
  oss << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << shape[i];
  }
  oss << ")";
  return oss.str();
}

size_t Tensor::ElementCount() const {
  return type_ == TensorType::kInt64 ? int64_data_.size() : float_data_.size();
}

Status Tensor::FromInt64(std::vector<int64_t> data,
                         std::vector<int64_t> shape,
                         Tensor* out) {
  size_t expected = 0;
  Status s = ShapeElementCount(shape, &expected);
  if (!s.ok()) return s;
  if (expected != data.size()) {
    return Status::TensorShapeError(
        "Cannot reshape " + std::to_string(data.size()) +
        " int64 elements into " + ShapeToString(shape));
  }
  out->type_ = TensorType::kInt64;
  out->shape_ = std::move(shape);
  out->int64_data_ = std::move(data);
  out->float_data_.clear();
  return Status::OK();
}

Status Tensor::FromFloat(std::vector<float> data,
                         std::vector<int64_t> shape,
                         Tensor* out) {
  size_t expected = 0;
  Status s = ShapeElementCount(shape, &expected);
  if (!s.ok()) return s;
  if (expected != data.size()) {
    return Status::TensorShapeError(
        "Cannot reshape " + std::to_string(data.size()) +
        " float elements into " + ShapeToString(shape));
  }
  out->type_ = TensorType::kFloat32;
  out->shape_ = std::move(shape);
  out->float_data_ = std::move(data);
  out->int64_data_.clear();
  return Status::OK();
}

}  // namespace textembed
