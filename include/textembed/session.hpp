#pragma once

#include <textembed/status.hpp>
#include <textembed/tensor.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textembed {

/** Hardware/software backends the inference engine may run on. */
enum class ExecutionProvider {
  kCPU,
  kCUDA,
  kTensorRT
};

const char* ExecutionProviderName(ExecutionProvider provider);

/** Accepts "cpu", "cuda", "tensorrt" (case-insensitive). */
Status ParseExecutionProvider(std::string_view text, ExecutionProvider* out);

struct SessionOptions {
  // Preference order; the engine uses the first one that can run each node
  // and falls back to CPU.
  std::vector<ExecutionProvider> execution_providers;

  // 0 = hardware concurrency
  size_t intra_threads = 0;
};

/**
 * A loaded network: named tensors in, named tensors out.
 *
 * Run() is const and may be called concurrently from several threads.
 */
class InferenceSession {
 public:
  virtual ~InferenceSession() = default;

  /**
   * Build an ONNX Runtime session from a model file.
   * External weight files referenced by the model are loaded from the
   * same directory. Fails with EngineBuildError.
   */
  static Status FromFile(const std::filesystem::path& model_path,
                         const SessionOptions& options,
                         std::unique_ptr<InferenceSession>* out);

  /** Same as FromFile() for a serialized model held in memory. */
  static Status FromMemory(const std::string& model_bytes,
                           const SessionOptions& options,
                           std::unique_ptr<InferenceSession>* out);

  /** Input names declared by the network, in declaration order. */
  virtual const std::vector<std::string>& InputNames() const = 0;

  bool HasInput(std::string_view name) const;

  /**
   * Run the network. Every declared output is returned.
   * Fails with InferenceRuntimeError.
   */
  virtual Status Run(const NamedTensors& inputs, NamedTensors* outputs) const = 0;
};

/** std::thread::hardware_concurrency(), at least 1. */
size_t HardwareThreads();

}  // namespace textembed
