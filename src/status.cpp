#include <textembed/status.hpp>

namespace textembed {

Status Status::WithContext(std::string_view context) const {
  if (ok()) return *this;
  std::string msg(context);
  msg += ": ";
  msg += message_;
  return Status(code_, msg);
}

std::string Status::ToString() const {
  if (ok()) return "OK";
  std::string out = CodeName(code_);
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

const char* Status::CodeName(Code code) {
  switch (code) {
    case Code::kOk:
      return "OK";
    case Code::kInvalidArgument:
      return "Invalid argument";
    case Code::kIOError:
      return "IO error";
    case Code::kRepositoryError:
      return "Repository error";
    case Code::kDataFormatError:
      return "Data format error";
    case Code::kEngineBuildError:
      return "Engine build error";
    case Code::kEncodingError:
      return "Encoding error";
    case Code::kTensorShapeError:
      return "Tensor shape error";
    case Code::kInferenceRuntimeError:
      return "Inference runtime error";
  }
  return "Unknown";
}

}  // namespace textembed
