#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vtob::core::common::net {

inline bool IsValidPort(std::uint32_t port) {
  return port >= 1 && port <= 65535;
}

inline std::string JoinHostPort(std::string_view host, std::uint16_t port) {
  return std::string(host) + ":" + std::to_string(port);
}

// Plain TCP connect with a deadline, closed immediately. Resolves the host,
// so DNS failure also reports unreachable.
bool ProbeTcp(const std::string& host, std::uint16_t port, int timeout_ms);

}  // namespace vtob::core::common::net
