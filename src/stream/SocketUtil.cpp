#include "stream/SocketUtil.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace sanchez::stream {

Status ResolveIPv4(const std::string& host, uint16_t port, sockaddr_in& addr) {
  addr = sockaddr_in{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);

  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    return Status::Ok();
  }
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
    return Status::Ok();
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  addrinfo* result = nullptr;
  const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || !result) {
    return Status(ErrorCode::kIOError,
                  "cannot resolve " + host + ": " + gai_strerror(rc));
  }
  addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return Status::Ok();
}

Status PollFd(int fd, short events, uint32_t timeout_ms) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = events;
  while (true) {
    const int rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc > 0) {
      if (pfd.revents & POLLNVAL) {
        return Status(ErrorCode::kDisconnected, "socket closed");
      }
      return Status::Ok();
    }
    if (rc == 0) {
      return Status(ErrorCode::kTimeout, "poll timed out");
    }
    if (errno != EINTR) {
      return SocketError("poll", errno);
    }
  }
}

Status SocketError(const std::string& what, int err) {
  return Status(ErrorCode::kIOError, what + ": " + std::strerror(err));
}

std::string FormatAddress(const sockaddr_in& addr) {
  char text[INET_ADDRSTRLEN] = {0};
  inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
  return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace sanchez::stream
