#include <textembed/server/config.hpp>
#include <textembed/server/server.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <iostream>

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    // Parse configuration from command line (and optionally config file)
    auto config = textembed::server::Config::LoadFromArgs(argc, argv);
    config.Validate();
    trantor::Logger::setLogLevel(ToLogLevel(config.server.log_level));

    // Loads the model, then serves until SIGINT/SIGTERM
    textembed::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
