#include <textembed/server/config.hpp>

#include <textembed/models.hpp>
#include <textembed/session.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace textembed::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 8080)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --model, -m <name>        Model to serve (default: BGESmallENV15)\n"
            << "  --cache-dir <path>        Model cache directory\n"
            << "  --max-length <n>          Token limit per text (default: 512)\n"
            << "  --batch-size <n>          Default batch size (default: 256)\n"
            << "  --provider <name>         Execution provider, repeatable: cpu, cuda, tensorrt\n"
            << "  --no-metrics              Disable the metrics endpoint\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --drain-timeout <s>       Wait for in-flight requests on shutdown (default: 30)\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --model BGESmallENV15 --port 8080\n"
            << "  " << argv0 << " --config /etc/textembed/server.yaml\n"
            << "  " << argv0 << " -m Xenova/all-MiniLM-L6-v2 --provider cuda --provider cpu\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
//     list: [a, b]
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

// "[cuda, cpu]" or "cuda, cpu" or "cuda"
std::vector<std::string> ParseList(const std::string& value) {
  std::string body = value;
  if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
    body = body.substr(1, body.size() - 2);
  }
  std::vector<std::string> items;
  std::istringstream stream(body);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Unquote(Trim(item));
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

uint64_t ParseNumber(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid number for " + key + ": '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Number out of range for " + key + ": " + value);
  }
}

const char* RequireValue(int argc, char** argv, int* i, const std::string& what) {
  if (++*i >= argc) {
    throw std::runtime_error(std::string(argv[*i - 1]) + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) +
                               ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string raw = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (raw.empty()) {
      current_section = key;
      continue;
    }
    std::string value = Unquote(raw);
    const std::string qualified =
        current_section.empty() ? key : current_section + "." + key;

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        uint64_t port = ParseNumber(qualified, value);
        if (port > 65535) {
          throw std::runtime_error("Invalid port number: " + value);
        }
        config.server.port = static_cast<uint16_t>(port);
      } else if (key == "threads") {
        config.server.threads = static_cast<uint32_t>(ParseNumber(qualified, value));
      } else if (key == "log_level") {
        config.server.log_level = value;
      } else if (key == "drain_timeout_seconds") {
        config.server.drain_timeout_seconds =
            static_cast<uint32_t>(ParseNumber(qualified, value));
      }
    } else if (current_section == "model") {
      if (key == "name") {
        config.model.name = value;
      } else if (key == "cache_dir") {
        config.model.cache_dir = value;
      } else if (key == "max_length") {
        config.model.max_length = static_cast<size_t>(ParseNumber(qualified, value));
      } else if (key == "batch_size") {
        config.model.batch_size = static_cast<size_t>(ParseNumber(qualified, value));
      } else if (key == "providers") {
        config.model.providers = ParseList(raw);
      } else if (key == "show_download_progress") {
        config.model.show_download_progress = ParseBool(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is the base layer, so find it before applying flags.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config_file = RequireValue(argc, argv, &i, "a path argument");
    }
  }

  Config config = config_file.empty() ? Config() : LoadFromFile(config_file);
  bool providers_from_cli = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--host") {
      config.server.host = RequireValue(argc, argv, &i, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      uint64_t port = ParseNumber("--port", RequireValue(argc, argv, &i, "a port number"));
      if (port > 65535) {
        throw std::runtime_error("Invalid port number: " + std::to_string(port));
      }
      config.server.port = static_cast<uint16_t>(port);
    } else if (arg == "--threads") {
      config.server.threads = static_cast<uint32_t>(
          ParseNumber("--threads", RequireValue(argc, argv, &i, "a number")));
    } else if (arg == "--model" || arg == "-m") {
      config.model.name = RequireValue(argc, argv, &i, "a model name");
    } else if (arg == "--cache-dir") {
      config.model.cache_dir = RequireValue(argc, argv, &i, "a path");
    } else if (arg == "--max-length") {
      config.model.max_length = static_cast<size_t>(
          ParseNumber("--max-length", RequireValue(argc, argv, &i, "a number")));
    } else if (arg == "--batch-size") {
      config.model.batch_size = static_cast<size_t>(
          ParseNumber("--batch-size", RequireValue(argc, argv, &i, "a number")));
    } else if (arg == "--provider") {
      // Flags replace the file's provider list rather than extending it.
      if (!providers_from_cli) {
        config.model.providers.clear();
        providers_from_cli = true;
      }
      config.model.providers.push_back(RequireValue(argc, argv, &i, "a provider name"));
    } else if (arg == "--no-metrics") {
      config.metrics.enabled = false;
    } else if (arg == "--log-level") {
      config.server.log_level = RequireValue(argc, argv, &i, "a level");
    } else if (arg == "--drain-timeout") {
      config.server.drain_timeout_seconds = static_cast<uint32_t>(
          ParseNumber("--drain-timeout", RequireValue(argc, argv, &i, "seconds")));
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (model.batch_size == 0) {
    throw std::runtime_error("model.batch_size must be greater than zero");
  }
  if (model.max_length == 0) {
    throw std::runtime_error("model.max_length must be greater than zero");
  }
  if (model.cache_dir.empty()) {
    throw std::runtime_error("model.cache_dir must not be empty");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }

  // Unknown model or provider names throw from here.
  ToInitOptions();
}

InitOptions Config::ToInitOptions() const {
  InitOptions options;

  Status s = ParseModel(model.name, &options.model);
  if (!s.ok()) {
    throw std::runtime_error("Invalid model.name: " + s.ToString());
  }

  for (const auto& name : model.providers) {
    ExecutionProvider provider;
    s = ParseExecutionProvider(name, &provider);
    if (!s.ok()) {
      throw std::runtime_error("Invalid model.providers entry: " + s.ToString());
    }
    options.execution_providers.push_back(provider);
  }

  options.max_length = model.max_length;
  options.cache_dir = model.cache_dir;
  options.show_download_progress = model.show_download_progress;
  return options;
}

}  // namespace textembed::server
