#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "gateway/gateway_core.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config file.yaml] [--log-file path|-] [--log-level level] [--print-version]\n";
}

std::optional<vtob::gateway::Args> ParseArgs(int argc, char** argv) {
  vtob::gateway::Args out;
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

    std::string* target = nullptr;
    if (a == "--config") {
      target = &out.config_yaml;
    } else if (a == "--log-file") {
      target = &out.log_file;
    } else if (a == "--log-level") {
      target = &out.log_level;
    } else {
      std::cerr << "unknown argument: " << a << "\n";
      return std::nullopt;
    }

    const auto v = take_value();
    if (!v.has_value()) {
      std::cerr << a << " needs a value\n";
      return std::nullopt;
    }
    *target = *v;
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  const auto args = ParseArgs(argc, argv);
  if (!args.has_value()) {
    PrintUsage(argv[0]);
    return 2;
  }
  return vtob::gateway::GatewayCore::Run(*args);
}
