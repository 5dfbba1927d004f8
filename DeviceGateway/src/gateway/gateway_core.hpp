#pragma once

#include <atomic>
#include <optional>
#include <string>

namespace devgw {
namespace gateway {

// Command-line overrides. Unset fields keep the value from the YAML file.
struct Args {
  std::string config_yaml;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::string> listen;

  bool print_version = false;
};

class GatewayCore {
public:
  // Blocks until SIGINT/SIGTERM or RequestStop(). Returns the process exit code.
  static int Run(const Args& args);

  static void RequestStop();
  static const char* Version();

private:
  static std::atomic<bool>& RunningFlag();
  static void HandleSignal(int);
};

}  // namespace gateway
}  // namespace devgw
