#include "core/common/utils/network_utils.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace vtob::core::common::net {

namespace {

bool TryConnect(const struct addrinfo* ai, int timeout_ms) {
  const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) return false;

  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    ::close(fd);
    return false;
  }

  bool ok = false;
  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
    ok = true;
  } else if (errno == EINPROGRESS) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    if (::poll(&pfd, 1, timeout_ms) == 1) {
      int err = 0;
      socklen_t len = sizeof(err);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) ok = true;
    }
  }

  ::close(fd);
  return ok;
}

}  // namespace

bool ProbeTcp(const std::string& host, std::uint16_t port, int timeout_ms) {
  if (host.empty() || !IsValidPort(port)) return false;

  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || res == nullptr) {
    return false;
  }

  bool ok = false;
  for (const struct addrinfo* ai = res; ai != nullptr && !ok; ai = ai->ai_next) {
    ok = TryConnect(ai, timeout_ms);
  }
  ::freeaddrinfo(res);
  return ok;
}

}  // namespace vtob::core::common::net
