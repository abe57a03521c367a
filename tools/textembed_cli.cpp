#include <textembed/models.hpp>
#include <textembed/session.hpp>
#include <textembed/text_embedding.hpp>
#include <textembed/version.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " models\n"
      << "  " << argv0 << " [options] embed [text...]   (reads stdin lines when no text)\n"
      << "\noptions:\n"
      << "  --model <name>        enum-style or repository name (default: BGESmallENV15)\n"
      << "  --cache-dir <path>    model cache directory\n"
      << "  --max-length <n>      token limit per text\n"
      << "  --batch-size <n>      texts per inference batch\n"
      << "  --provider <name>     cpu, cuda or tensorrt; repeatable\n"
      << "  --quiet               only log errors\n"
      << "  --version             print version\n";
}

static size_t parse_size(const std::string& flag, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid number for " + flag + ": '" + value + "'");
  }
  return static_cast<size_t>(std::stoull(value));
}

static Json::StreamWriterBuilder compact_writer() {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return builder;
}

static int list_models() {
  auto writer = compact_writer();
  for (const auto& info : textembed::SupportedModels()) {
    Json::Value json;
    json["name"] = info.name;
    json["model_code"] = info.model_code;
    json["dim"] = static_cast<Json::UInt64>(info.dim);
    json["description"] = info.description;
    std::cout << Json::writeString(writer, json) << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  textembed::InitOptions options;
  std::optional<size_t> batch_size;
  std::string cmd;
  std::vector<std::string> texts;

  try {
    int i = 1;
    for (; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (++i >= argc) throw std::runtime_error(arg + " requires a value");
        return argv[i];
      };

      if (arg == "--help" || arg == "-h") {
        usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << textembed::Version() << "\n";
        return 0;
      } else if (arg == "--model") {
        auto s = textembed::ParseModel(value(), &options.model);
        if (!s.ok()) throw std::runtime_error(s.ToString());
      } else if (arg == "--cache-dir") {
        options.cache_dir = value();
      } else if (arg == "--max-length") {
        options.max_length = parse_size(arg, value());
      } else if (arg == "--batch-size") {
        batch_size = parse_size(arg, value());
      } else if (arg == "--provider") {
        textembed::ExecutionProvider provider;
        auto s = textembed::ParseExecutionProvider(value(), &provider);
        if (!s.ok()) throw std::runtime_error(s.ToString());
        options.execution_providers.push_back(provider);
      } else if (arg == "--quiet") {
        options.show_download_progress = false;
        trantor::Logger::setLogLevel(trantor::Logger::kError);
      } else if (!arg.empty() && arg[0] == '-') {
        throw std::runtime_error("Unknown option: " + arg);
      } else {
        cmd = arg;
        ++i;
        break;
      }
    }
    for (; i < argc; ++i) texts.emplace_back(argv[i]);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  if (cmd == "models") {
    return list_models();
  }
  if (cmd != "embed") {
    usage(argv[0]);
    return 2;
  }

  if (texts.empty()) {
    std::string line;
    while (std::getline(std::cin, line)) texts.push_back(line);
  }

  std::unique_ptr<textembed::TextEmbedding> model;
  auto s = textembed::TextEmbedding::Open(options, &model);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<textembed::Embedding> embeddings;
  s = model->Embed(texts, &embeddings, batch_size);
  if (!s.ok()) {
    std::cerr << "Embed failed: " << s.ToString() << "\n";
    return 1;
  }

  auto writer = compact_writer();
  for (size_t i = 0; i < embeddings.size(); ++i) {
    Json::Value json;
    json["index"] = static_cast<Json::UInt64>(i);
    json["text"] = texts[i];
    Json::Value vector(Json::arrayValue);
    for (float v : embeddings[i]) vector.append(static_cast<double>(v));
    json["embedding"] = std::move(vector);
    std::cout << Json::writeString(writer, json) << "\n";
  }
  return 0;
}
