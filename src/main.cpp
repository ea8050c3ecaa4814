#include "config/options.hpp"
#include "core/error.hpp"
#include "lifecycle/client_app.hpp"
#include "lifecycle/server_app.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitConfigError = 2;

void PrintUsage(std::ostream &os) {
  os << "usage: linecast <server|client> [flags]\n\n"
     << config::ServerUsage() << config::ClientUsage();
}

logging::Level LevelFor(bool verbose) {
  return verbose ? logging::Level::debug : logging::Level::info;
}

int RunServer(const std::vector<std::string> &args) {
  auto opt = config::ParseServerOptions(args);
  if (!opt) {
    std::cerr << core::Describe(opt.error()) << "\n" << config::ServerUsage();
    return kExitConfigError;
  }
  if (opt->help) {
    std::cout << config::ServerUsage();
    return 0;
  }
  logging::ConsoleLogger log(LevelFor(opt->verbose));
  lifecycle::ServerApp app(std::move(*opt), log);
  return app.Run();
}

int RunClient(const std::vector<std::string> &args) {
  auto opt = config::ParseClientOptions(args);
  if (!opt) {
    std::cerr << core::Describe(opt.error()) << "\n" << config::ClientUsage();
    return kExitConfigError;
  }
  if (opt->help) {
    std::cout << config::ClientUsage();
    return 0;
  }
  logging::ConsoleLogger log(LevelFor(opt->verbose));
  lifecycle::ClientApp app(std::move(*opt), log);
  return app.Run();
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitConfigError;
  }
  const std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  if (command == "server") {
    return RunServer(args);
  }
  if (command == "client") {
    return RunClient(args);
  }
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage(std::cout);
    return 0;
  }
  std::cerr << "unknown command: " << command << "\n";
  PrintUsage(std::cerr);
  return kExitConfigError;
}
