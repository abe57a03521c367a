#include <textembed/session.hpp>

#include <onnxruntime_cxx_api.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <thread>

namespace textembed {

namespace {

class OnnxSession : public InferenceSession {
 public:
  OnnxSession()
      : env_(ORT_LOGGING_LEVEL_WARNING, "textembed"),
        memory_info_(Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator,
            OrtMemType::OrtMemTypeDefault)) {}

  // Exactly one of `model_path` / `model_bytes` is used.
  Status Initialize(const std::filesystem::path* model_path,
                    const std::string* model_bytes,
                    const SessionOptions& options) {
    try {
      Ort::SessionOptions session_options;
      const size_t threads =
          options.intra_threads > 0 ? options.intra_threads : HardwareThreads();
      session_options.SetIntraOpNumThreads(static_cast<int>(threads));
      session_options.SetGraphOptimizationLevel(
          GraphOptimizationLevel::ORT_ENABLE_ALL);

      std::string registered;
      for (ExecutionProvider provider : options.execution_providers) {
        if (AppendProvider(provider, &session_options)) {
          if (!registered.empty()) registered += ",";
          registered += ExecutionProviderName(provider);
        }
      }

      if (model_path) {
        session_ = std::make_unique<Ort::Session>(
            env_, model_path->c_str(), session_options);
      } else {
        session_ = std::make_unique<Ort::Session>(
            env_, model_bytes->data(), model_bytes->size(), session_options);
      }

      // Cache input/output names
      Ort::AllocatorWithDefaultOptions allocator;

      size_t num_inputs = session_->GetInputCount();
      for (size_t i = 0; i < num_inputs; ++i) {
        auto name = session_->GetInputNameAllocated(i, allocator);
        input_names_.push_back(name.get());
      }

      size_t num_outputs = session_->GetOutputCount();
      for (size_t i = 0; i < num_outputs; ++i) {
        auto name = session_->GetOutputNameAllocated(i, allocator);
        output_names_.push_back(name.get());
      }
      for (const auto& s : output_names_) {
        output_names_c_.push_back(s.c_str());
      }

      LOG_INFO << "ONNX session ready: " << num_inputs << " inputs, "
               << num_outputs << " outputs, " << threads << " threads, providers ["
               << (registered.empty() ? "cpu" : registered) << "]";
      return Status::OK();
    } catch (const Ort::Exception& e) {
      return Status::EngineBuildError(e.what());
    } catch (const std::exception& e) {
      return Status::EngineBuildError(e.what());
    }
  }

  const std::vector<std::string>& InputNames() const override {
    return input_names_;
  }

  Status Run(const NamedTensors& inputs, NamedTensors* outputs) const override {
    try {
      std::vector<const char*> names;
      std::vector<Ort::Value> values;
      names.reserve(inputs.size());
      values.reserve(inputs.size());

      for (const auto& [name, tensor] : inputs) {
        names.push_back(name.c_str());
        const auto& shape = tensor.shape();
        if (tensor.type() == TensorType::kInt64) {
          // ORT takes a mutable pointer but does not write through it.
          auto* data = const_cast<int64_t*>(tensor.int64_data().data());
          values.push_back(Ort::Value::CreateTensor<int64_t>(
              memory_info_, data, tensor.int64_data().size(), shape.data(),
              shape.size()));
        } else {
          auto* data = const_cast<float*>(tensor.float_data().data());
          values.push_back(Ort::Value::CreateTensor<float>(
              memory_info_, data, tensor.float_data().size(), shape.data(),
              shape.size()));
        }
      }

      auto results = session_->Run(Ort::RunOptions{nullptr}, names.data(),
                                   values.data(), values.size(),
                                   output_names_c_.data(), output_names_c_.size());

      NamedTensors converted;
      for (size_t i = 0; i < results.size(); ++i) {
        auto info = results[i].GetTensorTypeAndShapeInfo();
        std::vector<int64_t> shape = info.GetShape();
        const size_t count = info.GetElementCount();

        Tensor tensor;
        Status s;
        switch (info.GetElementType()) {
          case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
            const float* data = results[i].GetTensorData<float>();
            s = Tensor::FromFloat(std::vector<float>(data, data + count),
                                  std::move(shape), &tensor);
            break;
          }
          case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64: {
            const int64_t* data = results[i].GetTensorData<int64_t>();
            s = Tensor::FromInt64(std::vector<int64_t>(data, data + count),
                                  std::move(shape), &tensor);
            break;
          }
          default:
            LOG_DEBUG << "Skipping output " << output_names_[i]
                      << " with unsupported element type";
            continue;
        }
        if (!s.ok()) return s;
        converted.emplace(output_names_[i], std::move(tensor));
      }

      *outputs = std::move(converted);
      return Status::OK();
    } catch (const Ort::Exception& e) {
      return Status::InferenceRuntimeError(e.what());
    }
  }

 private:
  static bool AppendProvider(ExecutionProvider provider,
                             Ort::SessionOptions* session_options) {
    try {
      switch (provider) {
        case ExecutionProvider::kCPU:
          // Always available as the fallback.
          return true;
        case ExecutionProvider::kCUDA: {
          OrtCUDAProviderOptions cuda_options;
          cuda_options.device_id = 0;
          session_options->AppendExecutionProvider_CUDA(cuda_options);
          return true;
        }
        case ExecutionProvider::kTensorRT: {
          OrtTensorRTProviderOptions trt_options{};
          trt_options.device_id = 0;
          session_options->AppendExecutionProvider_TensorRT(trt_options);
          return true;
        }
      }
    } catch (const Ort::Exception& e) {
      LOG_WARN << ExecutionProviderName(provider)
               << " execution provider not available: " << e.what();
    }
    return false;
  }

  Ort::Env env_;
  Ort::MemoryInfo memory_info_;
  std::unique_ptr<Ort::Session> session_;

  std::vector<std::string> input_names_;
  std::vector<std::string> output_names_;
  std::vector<const char*> output_names_c_;
};

}  // namespace

const char* ExecutionProviderName(ExecutionProvider provider) {
  switch (provider) {
    case ExecutionProvider::kCPU:
      return "cpu";
    case ExecutionProvider::kCUDA:
      return "cuda";
    case ExecutionProvider::kTensorRT:
      return "tensorrt";
  }
  return "unknown";
}

Status ParseExecutionProvider(std::string_view text, ExecutionProvider* out) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (ExecutionProvider p : {ExecutionProvider::kCPU, ExecutionProvider::kCUDA,
                              ExecutionProvider::kTensorRT}) {
    if (lower == ExecutionProviderName(p)) {
      *out = p;
      return Status::OK();
    }
  }
  return Status::InvalidArgument("Unknown execution provider: " + std::string(text));
}

size_t HardwareThreads() {
  unsigned int n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

bool InferenceSession::HasInput(std::string_view name) const {
  const auto& names = InputNames();
  return std::find(names.begin(), names.end(), name) != names.end();
}

Status InferenceSession::FromFile(const std::filesystem::path& model_path,
                                  const SessionOptions& options,
                                  std::unique_ptr<InferenceSession>* out) {
  auto session = std::make_unique<OnnxSession>();
  Status s = session->Initialize(&model_path, nullptr, options);
  if (!s.ok()) return s.WithContext("Failed to load " + model_path.string());
  *out = std::move(session);
  return Status::OK();
}

Status InferenceSession::FromMemory(const std::string& model_bytes,
                                    const SessionOptions& options,
                                    std::unique_ptr<InferenceSession>* out) {
  auto session = std::make_unique<OnnxSession>();
  Status s = session->Initialize(nullptr, &model_bytes, options);
  if (!s.ok()) return s.WithContext("Failed to load in-memory model");
  *out = std::move(session);
  return Status::OK();
}

}  // namespace textembed
