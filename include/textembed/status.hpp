#pragma once

#include <string>
#include <string_view>

namespace textembed {

/**
 * Result of a fallible operation.
 *
 * A code plus a human-readable message.
 * Functions that produce a value take an output pointer and return a Status.
 */
class Status {
 public:
  enum class Code {
    kOk = 0,
    kInvalidArgument,
    kIOError,
    kRepositoryError,      // required file missing or unreachable
    kDataFormatError,      // malformed config / tokenizer definition
    kEngineBuildError,     // inference session could not be created
    kEncodingError,        // tokenizer failed on a batch
    kTensorShapeError,     // tensor size or shape mismatch
    kInferenceRuntimeError // inference run failed
  };

  Status() = default;

  static Status OK() { return Status(); }

  static Status InvalidArgument(std::string_view msg) {
    return Status(Code::kInvalidArgument, msg);
  }
  static Status IOError(std::string_view msg) {
    return Status(Code::kIOError, msg);
  }
  static Status RepositoryError(std::string_view msg) {
    return Status(Code::kRepositoryError, msg);
  }
  static Status DataFormatError(std::string_view msg) {
    return Status(Code::kDataFormatError, msg);
  }
  static Status EngineBuildError(std::string_view msg) {
    return Status(Code::kEngineBuildError, msg);
  }
  static Status EncodingError(std::string_view msg) {
    return Status(Code::kEncodingError, msg);
  }
  static Status TensorShapeError(std::string_view msg) {
    return Status(Code::kTensorShapeError, msg);
  }
  static Status InferenceRuntimeError(std::string_view msg) {
    return Status(Code::kInferenceRuntimeError, msg);
  }

  bool ok() const { return code_ == Code::kOk; }
  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  bool IsInvalidArgument() const { return code_ == Code::kInvalidArgument; }
  bool IsIOError() const { return code_ == Code::kIOError; }
  bool IsRepositoryError() const { return code_ == Code::kRepositoryError; }
  bool IsDataFormatError() const { return code_ == Code::kDataFormatError; }
  bool IsEngineBuildError() const { return code_ == Code::kEngineBuildError; }
  bool IsEncodingError() const { return code_ == Code::kEncodingError; }
  bool IsTensorShapeError() const { return code_ == Code::kTensorShapeError; }
  bool IsInferenceRuntimeError() const {
    return code_ == Code::kInferenceRuntimeError;
  }

  /** Returns a copy with `context + ": "` prepended to the message. */
  Status WithContext(std::string_view context) const;

  /** "OK" or "<CodeName>: <message>". */
  std::string ToString() const;

  static const char* CodeName(Code code);

 private:
  Status(Code code, std::string_view msg) : code_(code), message_(msg) {}

  Code code_ = Code::kOk;
  std::string message_;
};

}  // namespace textembed
