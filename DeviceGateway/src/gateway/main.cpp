#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "gateway/gateway_core.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config FILE.yaml] [--log-file PATH] [--log-level LEVEL]"
               " [--listen URL] [--print-version]\n";
}

bool ParseArgs(int argc, char** argv, devgw::gateway::Args& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      ++i;
      return std::string(argv[i]);
    };

    if (a == "--print-version") {
      out.print_version = true;
      continue;
    }

    std::optional<std::string>* slot = nullptr;
    std::optional<std::string> config;
    if (a == "--config") {
      slot = &config;
    } else if (a == "--log-file") {
      slot = &out.log_file;
    } else if (a == "--log-level") {
      slot = &out.log_level;
    } else if (a == "--listen") {
      slot = &out.listen;
    } else {
      std::cerr << "unknown argument: " << a << "\n";
      return false;
    }

    *slot = take_value();
    if (!slot->has_value()) {
      std::cerr << "missing value for " << a << "\n";
      return false;
    }
    if (config) out.config_yaml = *config;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  devgw::gateway::Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 2;
  }
  return devgw::gateway::GatewayCore::Run(args);
}
