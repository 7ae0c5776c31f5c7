#ifndef SANCHEZ_STREAM_SOCKET_UTIL_H_
#define SANCHEZ_STREAM_SOCKET_UTIL_H_

#include <netinet/in.h>

#include <cstdint>
#include <string>

#include "sanchez/core/Status.h"

namespace sanchez::stream {

// Resolves an IPv4 host name or dotted address. "" and "0.0.0.0" map to INADDR_ANY.
Status ResolveIPv4(const std::string& host, uint16_t port, sockaddr_in& addr);

// Waits until fd is readable (POLLIN) or writable. Returns kTimeout, kIOError or Ok.
Status PollFd(int fd, short events, uint32_t timeout_ms);

// "errno text" with the given prefix, as kIOError.
Status SocketError(const std::string& what, int err);

std::string FormatAddress(const sockaddr_in& addr);

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_SOCKET_UTIL_H_
