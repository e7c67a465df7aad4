#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/common/logger/logger.hpp"

namespace vtob {
namespace gateway {

// Empty strings fall back to the config file, then to built-in defaults.
struct Args {
  std::string config_yaml;
  std::string log_file;  // "-" logs to stderr
  std::string log_level;

  bool print_version = false;
};

class GatewayCore {
public:
  // Blocks until SIGINT or SIGTERM. Returns the process exit code.
  static int Run(const Args& args);
};

std::optional<vtob::core::common::log::Level> ParseLogLevel(std::string_view s);

}  // namespace gateway
}  // namespace vtob
